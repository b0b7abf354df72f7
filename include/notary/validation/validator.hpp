#pragma once
#include <notary/schema/transaction_schema.hpp>
#include <notary/validation/outcome.hpp>

#include <json/json.h>

#include <optional>
#include <string>

namespace notary::validation {

/// Checks payloads against one transaction schema.
///
/// The validator never short-circuits: every missing required field and
/// every malformed field is reported. Fields the schema does not declare are
/// carried through untouched.
class payload_validator final {
 public:
  explicit payload_validator(const notary::schema::transaction_schema_t& schema);

  validation_outcome_t validate(const Json::Value& payload) const;

 private:
  // Reason the value breaks `field`, or std::nullopt when it conforms.
  std::optional<std::string> check_field(
      const notary::schema::field_spec_t& field,
      const Json::Value& value) const;

  const notary::schema::transaction_schema_t& schema_;
};

validation_outcome_t validate(const notary::schema::transaction_schema_t& schema,
                              const Json::Value& payload);

}  // namespace notary::validation
