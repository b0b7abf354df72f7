#include <notary/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace notary::schema {

namespace {

// Bitcoin alphabet: no 0, O, I or l.
constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

bool is_base58_char(const char c) {
  return kBase58Alphabet.find(c) != std::string_view::npos;
}

}  // namespace

bool is_valid_identifier(const std::string_view identifier) {
  return !identifier.empty();
}

bool is_base58(const std::string_view value) {
  if (value.empty()) {
    return false;
  }
  return std::all_of(std::begin(value), std::end(value), is_base58_char);
}

bool is_verkey(const std::string_view value) {
  if (!value.empty() && value.front() == '~') {
    return is_base58(value.substr(1));
  }
  return is_base58(value);
}

std::string join(const field_names_t& names, const std::string_view separator) {
  auto out = std::string{};
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i != 0) {
      out.append(separator);
    }
    out.append(names[i]);
  }
  return out;
}

}  // namespace notary::schema
