#pragma once
#include <notary/schema/transaction_schema.hpp>
#include <notary/schema/transaction_type.hpp>

#include <cstdint>

// Schema type: get nym.
// Identity lookup: reads the DID named by dest. Carries no payload fields.
namespace notary::schema {

inline constexpr auto kGetNymSchema =
    transaction_schema_t{.type = transaction_type_t::get_nym, .fields = {}};

template <uint16_t Version>
struct get_nym;

template <>
struct get_nym<1> final {
  static constexpr auto type = transaction_type_t::get_nym;
  static constexpr const transaction_schema_t& schema = kGetNymSchema;
};

using get_nym_t = get_nym<1>;

}  // namespace notary::schema
