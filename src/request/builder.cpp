#include <notary/encoding/json.hpp>
#include <notary/request/builder.hpp>
#include <notary/request/canonicalizer.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/registry.hpp>
#include <notary/validation/validator.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace notary::request {

namespace {

std::string describe(const request_error_t& error) {
  auto parts = notary::schema::field_names_t{};
  if (!error.missing_fields.empty()) {
    parts.push_back("missing [" +
                    notary::schema::join(error.missing_fields, ", ") + "]");
  }
  if (!error.malformed_fields.empty()) {
    auto malformed = notary::schema::field_names_t{};
    for (const auto& field : error.malformed_fields) {
      malformed.push_back(field.field + ": " + field.reason);
    }
    parts.push_back("malformed [" + notary::schema::join(malformed, "; ") +
                    "]");
  }
  return "invalid structure for " + error.transaction_type + " request: " +
         notary::schema::join(parts, ", ");
}

request_error_t make_invalid_structure(
    notary::validation::invalid_payload_t invalid,
    std::vector<notary::validation::field_error_t> identifier_errors) {
  auto error = request_error_t{
      .code = request_error_code::invalid_structure,
      .transaction_type = std::string{notary::schema::to_string(invalid.type)},
      .missing_fields = std::move(invalid.missing_fields),
      .malformed_fields = std::move(identifier_errors)};
  error.malformed_fields.insert(
      std::end(error.malformed_fields),
      std::make_move_iterator(std::begin(invalid.malformed_fields)),
      std::make_move_iterator(std::end(invalid.malformed_fields)));
  error.log = describe(error);
  return error;
}

std::vector<notary::validation::field_error_t> check_identifiers(
    const std::string_view identifier,
    const std::string_view dest) {
  auto errors = std::vector<notary::validation::field_error_t>{};
  if (!notary::schema::is_valid_identifier(identifier)) {
    errors.push_back(notary::validation::field_error_t{
        .field = "identifier", .reason = "must not be empty"});
  }
  if (!notary::schema::is_valid_identifier(dest)) {
    errors.push_back(notary::validation::field_error_t{
        .field = std::string{notary::schema::kOperationDestField},
        .reason = "must not be empty"});
  }
  return errors;
}

request_error_t make_unknown_type(const std::string_view type) {
  return request_error_t{
      .code = request_error_code::unknown_transaction_type,
      .transaction_type = std::string{type},
      .log = "unknown transaction type '" + std::string{type} + "'"};
}

}  // namespace

build_result_t build_request(const notary::schema::transaction_type_t type,
                             const std::string_view identifier,
                             const std::string_view dest,
                             const Json::Value& payload) {
  if (!notary::schema::is_supported(type)) {
    auto error = make_unknown_type(std::to_string(static_cast<uint16_t>(type)));
    spdlog::warn("Rejected request: {}", error.log);
    return error;
  }
  const auto& schema = notary::schema::schema_for(type);
  auto identifier_errors = check_identifiers(identifier, dest);
  auto outcome = notary::validation::validate(schema, payload);

  if (auto* invalid =
          std::get_if<notary::validation::invalid_payload_t>(&outcome)) {
    auto error =
        make_invalid_structure(std::move(*invalid), std::move(identifier_errors));
    spdlog::warn("Rejected {} request: {}", schema.name(), error.log);
    return error;
  }
  if (!identifier_errors.empty()) {
    auto error = make_invalid_structure(
        notary::validation::invalid_payload_t{.type = type},
        std::move(identifier_errors));
    spdlog::warn("Rejected {} request: {}", schema.name(), error.log);
    return error;
  }

  auto request = canonicalize(
      identifier, dest, std::get<notary::validation::valid_payload_t>(outcome));
  spdlog::debug("Built {} request for dest '{}'", schema.name(), dest);
  return request;
}

build_result_t build_request(const std::string_view type,
                             const std::string_view identifier,
                             const std::string_view dest,
                             const Json::Value& payload) {
  auto resolved = notary::schema::try_resolve_type(type);
  if (!resolved) {
    auto error = make_unknown_type(type);
    spdlog::warn("Rejected request: {}", error.log);
    return error;
  }
  return build_request(*resolved, identifier, dest, payload);
}

build_result_t build_request_from_json(const std::string_view type,
                                       const std::string_view identifier,
                                       const std::string_view dest,
                                       const std::string_view payload_json) {
  auto resolved = notary::schema::try_resolve_type(type);
  if (!resolved) {
    auto error = make_unknown_type(type);
    spdlog::warn("Rejected request: {}", error.log);
    return error;
  }

  auto parse_error = std::string{};
  auto payload =
      notary::encoding::json::try_parse_object(payload_json, parse_error);
  if (!payload) {
    auto invalid = notary::validation::invalid_payload_t{.type = *resolved};
    invalid.malformed_fields.push_back(
        notary::validation::field_error_t{.field = "data",
                                          .reason = parse_error});
    auto error = make_invalid_structure(std::move(invalid),
                                        check_identifiers(identifier, dest));
    spdlog::warn("Rejected {} request: {}", notary::schema::to_string(*resolved),
                 error.log);
    return error;
  }
  return build_request(*resolved, identifier, dest, *payload);
}

build_result_t build_node_request(const std::string_view identifier,
                                  const std::string_view dest,
                                  const Json::Value& payload) {
  return build_request(notary::schema::node_t::type, identifier, dest,
                       payload);
}

build_result_t build_nym_request(const std::string_view identifier,
                                 const std::string_view dest,
                                 const Json::Value& payload) {
  return build_request(notary::schema::nym_t::type, identifier, dest, payload);
}

build_result_t build_get_nym_request(const std::string_view identifier,
                                     const std::string_view dest) {
  return build_request(notary::schema::get_nym_t::type, identifier, dest,
                       Json::Value{Json::objectValue});
}

}  // namespace notary::request
