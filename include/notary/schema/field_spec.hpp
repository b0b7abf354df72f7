#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>

// Schema type: field spec.
// Declarative description of one operation field: presence, value kind and
// the constraint the validator applies to it.
namespace notary::schema {

enum class field_kind_t : uint8_t {
  string = 0,
  integer = 1,
  list = 2,
  enumeration = 3
};

enum class string_format_t : uint8_t {
  any = 0,
  non_empty = 1,
  base58 = 2,
  verkey = 3
};

inline constexpr auto kFieldKindMappings = std::array{
    std::pair<std::string_view, field_kind_t>{"string", field_kind_t::string},
    std::pair<std::string_view, field_kind_t>{"integer", field_kind_t::integer},
    std::pair<std::string_view, field_kind_t>{"list", field_kind_t::list},
    std::pair<std::string_view, field_kind_t>{"enumeration",
                                              field_kind_t::enumeration},
};

inline constexpr auto kStringFormatMappings = std::array{
    std::pair<std::string_view, string_format_t>{"any", string_format_t::any},
    std::pair<std::string_view, string_format_t>{"non_empty",
                                                 string_format_t::non_empty},
    std::pair<std::string_view, string_format_t>{"base58",
                                                 string_format_t::base58},
    std::pair<std::string_view, string_format_t>{"verkey",
                                                 string_format_t::verkey},
};

inline constexpr std::string_view to_string(const field_kind_t value) {
  return to_string(value, kFieldKindMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const string_format_t value) {
  return to_string(value, kStringFormatMappings).value_or("unknown");
}

template <uint16_t Version>
struct field_spec;

template <>
struct field_spec<1> final {
  uint16_t version{1};
  std::string_view name;
  bool required{true};
  field_kind_t kind{field_kind_t::string};
  // Applies to strings and to list elements.
  string_format_t format{string_format_t::any};
  // Members of an enumeration, or of list elements when non-empty.
  std::span<const std::string_view> allowed{};
  int64_t minimum{std::numeric_limits<int64_t>::min()};
  int64_t maximum{std::numeric_limits<int64_t>::max()};
  bool nullable{false};
};

using field_spec_t = field_spec<1>;

}  // namespace notary::schema
