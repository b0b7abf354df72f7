#pragma once
#include <notary/request/canonical_request.hpp>
#include <notary/request/request_error.hpp>
#include <notary/schema/transaction_type.hpp>

#include <json/json.h>

#include <string_view>
#include <variant>

namespace notary::request {

using build_result_t = std::variant<canonical_request_t, request_error_t>;

/// Validate `payload` against the schema of `type` and canonicalize it.
///
/// Returns `request_error_code::invalid_structure` listing every missing and
/// malformed field (an empty `identifier` or `dest` is reported as
/// malformed). No partial request is ever produced. Performs no I/O.
build_result_t build_request(notary::schema::transaction_type_t type,
                             std::string_view identifier,
                             std::string_view dest,
                             const Json::Value& payload);

/// As above, resolving `type` from a name ("NODE") or a code ("0").
///
/// Unresolvable types fail closed with
/// `request_error_code::unknown_transaction_type`.
build_result_t build_request(std::string_view type,
                             std::string_view identifier,
                             std::string_view dest,
                             const Json::Value& payload);

/// As above, for payloads still in JSON text form. Text that is not a JSON
/// object is an invalid structure.
build_result_t build_request_from_json(std::string_view type,
                                       std::string_view identifier,
                                       std::string_view dest,
                                       std::string_view payload_json);

build_result_t build_node_request(std::string_view identifier,
                                  std::string_view dest,
                                  const Json::Value& payload);

build_result_t build_nym_request(std::string_view identifier,
                                 std::string_view dest,
                                 const Json::Value& payload);

build_result_t build_get_nym_request(std::string_view identifier,
                                     std::string_view dest);

}  // namespace notary::request
