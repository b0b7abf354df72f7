#include <notary/encoding/json.hpp>
#include <notary/request/canonical_request.hpp>

namespace notary::request {

Json::Value to_json(const canonical_request_t& request) {
  auto root = Json::Value{Json::objectValue};
  root["identifier"] = request.identifier;
  root["operation"] = request.operation;
  return root;
}

std::string serialize(const canonical_request_t& request) {
  return notary::encoding::json::write_canonical(to_json(request));
}

bool operator==(const canonical_request_t& lhs,
                const canonical_request_t& rhs) {
  return lhs.version == rhs.version && lhs.identifier == rhs.identifier &&
         lhs.operation == rhs.operation;
}

}  // namespace notary::request
