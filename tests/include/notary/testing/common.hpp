#pragma once

#include <json/json.h>

#include <string_view>

namespace notary::testing {

inline constexpr auto kTrusteeDid = std::string_view{"V4SGRU86Z58d6TV7PBUe6f"};
inline constexpr auto kNodeDest = std::string_view{"VsKV7grR1BUE29mG2Fm2kX"};
inline constexpr auto kBlsKey =
    std::string_view{"CnEDk9HrMnmiHXEV1WFgbVCRteYnPqsJwrTdcZaNhFVW"};
inline constexpr auto kVerkey =
    std::string_view{"GJ1SzoWzavQYfNL9XkaJdrQejfztN4XqdsiV4ct3LXKL"};

// Complete, well-typed NODE payload.
inline Json::Value make_node_payload() {
  auto payload = Json::Value{Json::objectValue};
  payload["node_ip"] = "ip";
  payload["node_port"] = 1;
  payload["client_ip"] = "ip";
  payload["client_port"] = 1;
  payload["alias"] = "some";
  auto services = Json::Value{Json::arrayValue};
  services.append("VALIDATOR");
  payload["services"] = services;
  payload["blskey"] = std::string{kBlsKey};
  return payload;
}

inline constexpr auto kNodePayloadJson = std::string_view{
    R"({"node_ip":"ip","node_port":1,"client_ip":"ip","client_port":1,)"
    R"("alias":"some","services":["VALIDATOR"],)"
    R"("blskey":"CnEDk9HrMnmiHXEV1WFgbVCRteYnPqsJwrTdcZaNhFVW"})"};

}  // namespace notary::testing
