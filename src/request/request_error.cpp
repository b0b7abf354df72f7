#include <notary/request/request_error.hpp>

#include <utility>

namespace notary::request {

Json::Value to_json(const request_error_t& error) {
  auto root = Json::Value{Json::objectValue};
  root["code"] = static_cast<Json::UInt>(error.code);
  root["kind"] = std::string{to_string(error.code)};
  root["transaction_type"] = error.transaction_type;
  root["codespace"] = error.codespace;
  root["log"] = error.log;

  auto missing = Json::Value{Json::arrayValue};
  for (const auto& field : error.missing_fields) {
    missing.append(field);
  }
  root["missing_fields"] = std::move(missing);

  auto malformed = Json::Value{Json::arrayValue};
  for (const auto& field : error.malformed_fields) {
    auto entry = Json::Value{Json::objectValue};
    entry["field"] = field.field;
    entry["reason"] = field.reason;
    malformed.append(std::move(entry));
  }
  root["malformed_fields"] = std::move(malformed);
  return root;
}

}  // namespace notary::request
