#pragma once
#include <notary/schema/get_nym.hpp>
#include <notary/schema/node.hpp>
#include <notary/schema/nym.hpp>
#include <notary/schema/transaction_type.hpp>
#include <variant>

namespace notary::schema {

// Closed set of supported transaction types, one alternative per type.
using transaction_kind_t = std::variant<node_t, nym_t, get_nym_t>;

}  // namespace notary::schema
