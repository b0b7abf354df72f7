#pragma once
#include <notary/schema/enum_string.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/validation/outcome.hpp>

#include <json/json.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Request failure taxonomy: stable numeric codes returned to callers of the
// builder.
namespace notary::request {

enum class request_error_code : uint32_t {
  invalid_structure = 1,
  unknown_transaction_type = 2,
};

inline constexpr auto kRequestErrorCodeMappings = std::array{
    std::pair<std::string_view, request_error_code>{
        "invalid_structure", request_error_code::invalid_structure},
    std::pair<std::string_view, request_error_code>{
        "unknown_transaction_type",
        request_error_code::unknown_transaction_type},
};

inline constexpr std::string_view to_string(const request_error_code value) {
  return notary::schema::to_string(value, kRequestErrorCodeMappings)
      .value_or("unknown");
}

inline constexpr auto kRequestCodespace = std::string_view{"notary.request"};

template <uint16_t Version>
struct request_error;

template <>
struct request_error<1> final {
  uint16_t version{1};
  request_error_code code{request_error_code::invalid_structure};
  // Type name for invalid structures; the unresolved input otherwise.
  std::string transaction_type;
  notary::schema::field_names_t missing_fields;
  std::vector<notary::validation::field_error_t> malformed_fields;
  std::string log;
  std::string codespace{kRequestCodespace};
};

using request_error_t = request_error<1>;

Json::Value to_json(const request_error_t& error);

}  // namespace notary::request
