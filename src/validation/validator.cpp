#include <notary/schema/primitives.hpp>
#include <notary/validation/validator.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notary::validation {

namespace {

bool is_member(const std::span<const std::string_view> allowed,
               const std::string_view value) {
  return std::find(std::begin(allowed), std::end(allowed), value) !=
         std::end(allowed);
}

std::string describe_allowed(const std::span<const std::string_view> allowed) {
  auto names = notary::schema::field_names_t{};
  names.reserve(allowed.size());
  for (const auto name : allowed) {
    names.emplace_back(name);
  }
  return "[" + notary::schema::join(names, ", ") + "]";
}

std::optional<std::string> check_format(
    const notary::schema::string_format_t format,
    const std::string_view value) {
  switch (format) {
    case notary::schema::string_format_t::any:
      return std::nullopt;
    case notary::schema::string_format_t::non_empty:
      if (value.empty()) {
        return std::string{"must not be empty"};
      }
      return std::nullopt;
    case notary::schema::string_format_t::base58:
      if (!notary::schema::is_base58(value)) {
        return std::string{"expected base58 string"};
      }
      return std::nullopt;
    case notary::schema::string_format_t::verkey:
      if (!notary::schema::is_verkey(value)) {
        return std::string{"expected base58 verkey, optionally prefixed by ~"};
      }
      return std::nullopt;
  }
  return std::string{"unsupported string format"};
}

bool is_integer(const Json::Value& value) {
  return value.type() == Json::intValue || value.type() == Json::uintValue;
}

// Reals (including integers too wide for 64 bits, which the reader stores as
// doubles) do not survive a write/read cycle byte for byte.
void collect_non_integer_numbers(const Json::Value& value,
                                 const std::string& path,
                                 std::vector<field_error_t>& errors) {
  switch (value.type()) {
    case Json::realValue:
      errors.push_back(field_error_t{
          .field = path, .reason = "non-integer numbers are not canonical"});
      return;
    case Json::arrayValue:
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        collect_non_integer_numbers(value[i], fmt::format("{}[{}]", path, i),
                                    errors);
      }
      return;
    case Json::objectValue:
      for (const auto& name : value.getMemberNames()) {
        collect_non_integer_numbers(value[name], path + "." + name, errors);
      }
      return;
    default:
      return;
  }
}

}  // namespace

payload_validator::payload_validator(
    const notary::schema::transaction_schema_t& schema)
    : schema_{schema} {}

validation_outcome_t payload_validator::validate(
    const Json::Value& payload) const {
  auto invalid = invalid_payload_t{.type = schema_.type};

  if (!payload.isObject()) {
    invalid.malformed_fields.push_back(
        field_error_t{.field = "data", .reason = "expected JSON object"});
    for (const auto& field : schema_.fields) {
      if (field.required) {
        invalid.missing_fields.emplace_back(field.name);
      }
    }
    return invalid;
  }

  for (const auto& field : schema_.fields) {
    const auto name = std::string{field.name};
    if (!payload.isMember(name)) {
      if (field.required) {
        invalid.missing_fields.push_back(name);
      }
      continue;
    }
    if (auto reason = check_field(field, payload[name])) {
      invalid.malformed_fields.push_back(
          field_error_t{.field = name, .reason = std::move(*reason)});
    }
  }

  for (const auto& name : payload.getMemberNames()) {
    if (notary::schema::is_reserved_field(name)) {
      invalid.malformed_fields.push_back(field_error_t{
          .field = name, .reason = "reserved for the operation envelope"});
      continue;
    }
    if (!notary::schema::find_field(schema_, name)) {
      collect_non_integer_numbers(payload[name], name,
                                  invalid.malformed_fields);
    }
  }

  if (!invalid.missing_fields.empty() || !invalid.malformed_fields.empty()) {
    return invalid;
  }
  return valid_payload_t{schema_.type, payload};
}

std::optional<std::string> payload_validator::check_field(
    const notary::schema::field_spec_t& field,
    const Json::Value& value) const {
  if (value.isNull()) {
    if (field.nullable) {
      return std::nullopt;
    }
    return std::string{"must not be null"};
  }

  switch (field.kind) {
    case notary::schema::field_kind_t::string:
      if (!value.isString()) {
        return std::string{"expected string"};
      }
      return check_format(field.format, value.asString());

    case notary::schema::field_kind_t::integer:
      if (!is_integer(value)) {
        return std::string{"expected integer"};
      }
      if (!value.isInt64() || value.asInt64() < field.minimum ||
          value.asInt64() > field.maximum) {
        return fmt::format("must be between {} and {}", field.minimum,
                           field.maximum);
      }
      return std::nullopt;

    case notary::schema::field_kind_t::list:
      if (!value.isArray()) {
        return std::string{"expected list"};
      }
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        const auto& element = value[i];
        if (!element.isString()) {
          return fmt::format("element {} expected string", i);
        }
        const auto text = element.asString();
        if (auto reason = check_format(field.format, text)) {
          return fmt::format("element {} {}", i, *reason);
        }
        if (!field.allowed.empty() && !is_member(field.allowed, text)) {
          return fmt::format("element {} '{}' is not one of {}", i, text,
                             describe_allowed(field.allowed));
        }
      }
      return std::nullopt;

    case notary::schema::field_kind_t::enumeration:
      if (!value.isString()) {
        return std::string{"expected string"};
      }
      if (!is_member(field.allowed, value.asString())) {
        return fmt::format("'{}' is not one of {}", value.asString(),
                           describe_allowed(field.allowed));
      }
      return std::nullopt;
  }
  return std::string{"unsupported field kind"};
}

validation_outcome_t validate(const notary::schema::transaction_schema_t& schema,
                              const Json::Value& payload) {
  return payload_validator{schema}.validate(payload);
}

}  // namespace notary::validation
