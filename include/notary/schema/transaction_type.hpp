#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction type.
// Ledger operation classifier. The numeric value is the code carried as a
// string in operation.type.
namespace notary::schema {

enum class transaction_type_t : uint16_t {
  node = 0,
  nym = 1,
  get_nym = 105
};

inline constexpr auto kTransactionTypeMappings = std::array{
    std::pair<std::string_view, transaction_type_t>{"NODE",
                                                    transaction_type_t::node},
    std::pair<std::string_view, transaction_type_t>{"NYM",
                                                    transaction_type_t::nym},
    std::pair<std::string_view, transaction_type_t>{
        "GET_NYM", transaction_type_t::get_nym},
};

inline constexpr auto kTransactionCodeMappings = std::array{
    std::pair<std::string_view, transaction_type_t>{"0",
                                                    transaction_type_t::node},
    std::pair<std::string_view, transaction_type_t>{"1",
                                                    transaction_type_t::nym},
    std::pair<std::string_view, transaction_type_t>{
        "105", transaction_type_t::get_nym},
};

// Accepts either the type name or its code.
template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  if (auto type = from_string(value, kTransactionTypeMappings)) {
    return type;
  }
  return from_string(value, kTransactionCodeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

inline constexpr std::string_view to_code(const transaction_type_t value) {
  return to_string(value, kTransactionCodeMappings).value_or("unknown");
}

}  // namespace notary::schema
