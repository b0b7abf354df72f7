#pragma once
#include <notary/schema/field_spec.hpp>
#include <notary/schema/transaction_schema.hpp>
#include <notary/schema/transaction_type.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: node.
// Pool membership: announces or updates a validator node's network endpoints,
// alias, services and BLS key.
namespace notary::schema {

// Services a node may advertise; an empty list demotes the node.
inline constexpr auto kNodeServiceNames =
    std::array<std::string_view, 2>{"VALIDATOR", "OBSERVER"};

inline constexpr auto kPortMinimum = int64_t{1};
inline constexpr auto kPortMaximum = int64_t{65535};

inline constexpr auto kNodeFields = std::array{
    field_spec_t{.name = "node_ip", .format = string_format_t::non_empty},
    field_spec_t{.name = "node_port",
                 .kind = field_kind_t::integer,
                 .minimum = kPortMinimum,
                 .maximum = kPortMaximum},
    field_spec_t{.name = "client_ip", .format = string_format_t::non_empty},
    field_spec_t{.name = "client_port",
                 .kind = field_kind_t::integer,
                 .minimum = kPortMinimum,
                 .maximum = kPortMaximum},
    field_spec_t{.name = "alias", .format = string_format_t::non_empty},
    field_spec_t{.name = "services",
                 .kind = field_kind_t::list,
                 .allowed = kNodeServiceNames},
    field_spec_t{.name = "blskey", .format = string_format_t::base58},
};

inline constexpr auto kNodeSchema =
    transaction_schema_t{.type = transaction_type_t::node,
                         .fields = kNodeFields};

template <uint16_t Version>
struct node;

template <>
struct node<1> final {
  static constexpr auto type = transaction_type_t::node;
  static constexpr const transaction_schema_t& schema = kNodeSchema;
};

using node_t = node<1>;

}  // namespace notary::schema
