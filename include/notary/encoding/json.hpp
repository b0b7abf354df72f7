#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace notary::encoding::json {

/// Parse JSON text in strict mode.
///
/// Comments, duplicate keys, non-container roots and trailing content are
/// rejected. On failure `error` holds the parser's diagnostics.
std::optional<Json::Value> try_parse(std::string_view text, std::string& error);

/// As `try_parse`, additionally requiring the root to be an object.
std::optional<Json::Value> try_parse_object(std::string_view text,
                                            std::string& error);

/// Compact UTF-8 form with object keys in lexicographic order.
///
/// Equal values always produce byte-identical output; this is the form a
/// signer hashes.
std::string write_canonical(const Json::Value& value);

std::string write_pretty(const Json::Value& value);

}  // namespace notary::encoding::json
