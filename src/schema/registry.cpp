#include <notary/common/critical.hpp>
#include <notary/schema/registry.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <type_traits>

namespace notary::schema {

namespace {

constexpr auto kSupportedTypes = std::array{
    transaction_type_t::node, transaction_type_t::nym,
    transaction_type_t::get_nym};

static_assert(kSupportedTypes.size() == std::variant_size_v<transaction_kind_t>,
              "every transaction kind must be listed as supported");

}  // namespace

transaction_kind_t to_kind(const transaction_type_t type) {
  switch (type) {
    case transaction_type_t::node:
      return node_t{};
    case transaction_type_t::nym:
      return nym_t{};
    case transaction_type_t::get_nym:
      return get_nym_t{};
  }
  notary::common::critical("unsupported transaction type {}",
                           static_cast<uint16_t>(type));
}

const transaction_schema_t& schema_for(const transaction_type_t type) {
  return std::visit(
      [](const auto& kind) -> const transaction_schema_t& {
        return std::remove_cvref_t<decltype(kind)>::schema;
      },
      to_kind(type));
}

bool is_supported(const transaction_type_t type) {
  return std::find(std::begin(kSupportedTypes), std::end(kSupportedTypes),
                   type) != std::end(kSupportedTypes);
}

std::optional<transaction_type_t> try_resolve_type(
    const std::string_view value) {
  return try_from_string<transaction_type_t>(value);
}

std::optional<std::reference_wrapper<const transaction_schema_t>>
try_schema_for(const std::string_view value) {
  auto type = try_resolve_type(value);
  if (!type) {
    return std::nullopt;
  }
  return std::cref(schema_for(*type));
}

std::span<const transaction_type_t> supported_types() {
  return kSupportedTypes;
}

}  // namespace notary::schema
