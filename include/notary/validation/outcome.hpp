#pragma once
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_type.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace notary::validation {

class payload_validator;

template <uint16_t Version>
struct field_error;

template <>
struct field_error<1> final {
  uint16_t version{1};
  notary::schema::field_name_t field;
  std::string reason;
};

using field_error_t = field_error<1>;

/// Payload that passed schema validation, frozen for canonicalization.
///
/// Only `payload_validator` can construct one, so holding a
/// `valid_payload_t` proves the fields were checked against the schema of
/// `type()`.
class valid_payload final {
 public:
  notary::schema::transaction_type_t type() const { return type_; }
  const Json::Value& fields() const { return fields_; }

 private:
  friend class payload_validator;

  valid_payload(notary::schema::transaction_type_t type, Json::Value fields)
      : type_{type}, fields_{std::move(fields)} {}

  notary::schema::transaction_type_t type_;
  Json::Value fields_;
};

using valid_payload_t = valid_payload;

template <uint16_t Version>
struct invalid_payload;

template <>
struct invalid_payload<1> final {
  uint16_t version{1};
  notary::schema::transaction_type_t type{};
  notary::schema::field_names_t missing_fields;  // schema declaration order
  std::vector<field_error_t> malformed_fields;
};

using invalid_payload_t = invalid_payload<1>;

using validation_outcome_t = std::variant<valid_payload_t, invalid_payload_t>;

}  // namespace notary::validation
