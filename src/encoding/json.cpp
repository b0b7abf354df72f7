#include <notary/encoding/json.hpp>

#include <memory>

namespace notary::encoding::json {

namespace {

Json::StreamWriterBuilder make_writer_builder(const std::string& indentation) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = indentation;
  builder["commentStyle"] = "None";
  builder["emitUTF8"] = true;
  builder["enableYAMLCompatibility"] = false;
  builder["dropNullPlaceholders"] = false;
  return builder;
}

}  // namespace

std::optional<Json::Value> try_parse(const std::string_view text,
                                     std::string& error) {
  auto builder = Json::CharReaderBuilder{};
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};

  auto value = Json::Value{};
  auto errors = Json::String{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value,
                     &errors)) {
    error = errors.empty() ? std::string{"malformed JSON"} : errors;
    return std::nullopt;
  }
  return value;
}

std::optional<Json::Value> try_parse_object(const std::string_view text,
                                            std::string& error) {
  auto value = try_parse(text, error);
  if (!value) {
    return std::nullopt;
  }
  if (!value->isObject()) {
    error = "expected JSON object";
    return std::nullopt;
  }
  return value;
}

// Json::Value keeps object members in a std::map, so the writer already
// emits keys in sorted order.
std::string write_canonical(const Json::Value& value) {
  static const auto kBuilder = make_writer_builder("");
  return Json::writeString(kBuilder, value);
}

std::string write_pretty(const Json::Value& value) {
  static const auto kBuilder = make_writer_builder("  ");
  return Json::writeString(kBuilder, value);
}

}  // namespace notary::encoding::json
