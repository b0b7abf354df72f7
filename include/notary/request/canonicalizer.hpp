#pragma once
#include <notary/request/canonical_request.hpp>
#include <notary/validation/outcome.hpp>

#include <string_view>

namespace notary::request {

/// Assemble the canonical request for a validated payload.
///
/// The transaction type code comes from `payload`. Deterministic: the same
/// inputs always yield an equal request.
canonical_request_t canonicalize(std::string_view identifier,
                                 std::string_view dest,
                                 const notary::validation::valid_payload_t& payload);

}  // namespace notary::request
