#pragma once
#include <notary/schema/field_spec.hpp>
#include <notary/schema/transaction_type.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

// Schema type: transaction schema.
// The full field layout of one transaction type's operation. Instances are
// constexpr tables and never change after compilation.
namespace notary::schema {

// Envelope members of an operation; payloads may not define them.
inline constexpr auto kOperationTypeField = std::string_view{"type"};
inline constexpr auto kOperationDestField = std::string_view{"dest"};

template <uint16_t Version>
struct transaction_schema;

template <>
struct transaction_schema<1> final {
  uint16_t version{1};
  transaction_type_t type{};
  std::span<const field_spec_t> fields{};

  constexpr std::string_view name() const { return to_string(type); }
  constexpr std::string_view code() const { return to_code(type); }
};

using transaction_schema_t = transaction_schema<1>;

constexpr std::optional<field_spec_t> find_field(
    const transaction_schema_t& schema,
    const std::string_view name) {
  for (const auto& field : schema.fields) {
    if (field.name == name) {
      return field;
    }
  }
  return std::nullopt;
}

constexpr bool is_reserved_field(const std::string_view name) {
  return name == kOperationTypeField || name == kOperationDestField;
}

}  // namespace notary::schema
