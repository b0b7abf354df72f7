#pragma once
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_schema.hpp>
#include <notary/schema/transaction_type.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string_view>

namespace notary::schema {

/// Map a transaction type onto its alternative of the closed variant.
transaction_kind_t to_kind(transaction_type_t type);

/// Schema of a supported transaction type.
///
/// Total over the named `transaction_type_t` values. A value outside them
/// (e.g. a cast integer) is a programming error and terminates; check
/// `is_supported` first when the value comes from outside.
const transaction_schema_t& schema_for(transaction_type_t type);

/// True when `type` is one of the named, supported transaction types.
bool is_supported(transaction_type_t type);

/// Resolve a type name ("NODE") or code ("0").
///
/// Unknown input yields `std::nullopt`; callers must fail closed.
std::optional<transaction_type_t> try_resolve_type(std::string_view value);

/// Schema lookup by name or code; `std::nullopt` for unknown types.
std::optional<std::reference_wrapper<const transaction_schema_t>>
try_schema_for(std::string_view value);

/// Every supported transaction type, in ascending code order.
std::span<const transaction_type_t> supported_types();

}  // namespace notary::schema
