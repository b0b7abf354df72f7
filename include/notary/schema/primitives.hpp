#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace notary::schema {

using identifier_t = std::string;  // DID of an actor or target, opaque here
using field_name_t = std::string;
using field_names_t = std::vector<field_name_t>;

bool is_valid_identifier(const std::string_view identifier);

bool is_base58(const std::string_view value);

// Full base58 verkey, or "~" followed by the abbreviated base58 form.
bool is_verkey(const std::string_view value);

std::string join(const field_names_t& names, const std::string_view separator);

}  // namespace notary::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
