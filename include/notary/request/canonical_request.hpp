#pragma once
#include <notary/schema/primitives.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>

namespace notary::request {

template <uint16_t Version>
struct canonical_request;

// Unsigned ledger request. `operation` holds "type", "dest" and the payload
// fields side by side.
template <>
struct canonical_request<1> final {
  uint16_t version{1};
  notary::schema::identifier_t identifier;
  Json::Value operation{Json::objectValue};
};

using canonical_request_t = canonical_request<1>;

/// {"identifier": ..., "operation": {...}}
Json::Value to_json(const canonical_request_t& request);

/// Canonical text of `to_json(request)`; the bytes a signer signs.
std::string serialize(const canonical_request_t& request);

bool operator==(const canonical_request_t& lhs, const canonical_request_t& rhs);

}  // namespace notary::request
