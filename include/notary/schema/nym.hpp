#pragma once
#include <notary/schema/field_spec.hpp>
#include <notary/schema/transaction_schema.hpp>
#include <notary/schema/transaction_type.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: nym.
// Identity registration: writes a DID with its verkey, alias and role. A null
// role clears the current one.
namespace notary::schema {

// Roles travel as their numeric codes: trustee, steward, endorser and
// network monitor.
inline constexpr auto kNymRoleCodes =
    std::array<std::string_view, 4>{"0", "2", "101", "201"};

inline constexpr auto kNymFields = std::array{
    field_spec_t{.name = "verkey",
                 .required = false,
                 .format = string_format_t::verkey},
    field_spec_t{.name = "alias",
                 .required = false,
                 .format = string_format_t::non_empty},
    field_spec_t{.name = "role",
                 .required = false,
                 .kind = field_kind_t::enumeration,
                 .allowed = kNymRoleCodes,
                 .nullable = true},
};

inline constexpr auto kNymSchema = transaction_schema_t{
    .type = transaction_type_t::nym, .fields = kNymFields};

template <uint16_t Version>
struct nym;

template <>
struct nym<1> final {
  static constexpr auto type = transaction_type_t::nym;
  static constexpr const transaction_schema_t& schema = kNymSchema;
};

using nym_t = nym<1>;

}  // namespace notary::schema
