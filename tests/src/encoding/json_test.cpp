#include <gtest/gtest.h>
#include <notary/encoding/json.hpp>
#include <notary/testing/common.hpp>

#include <string>

TEST(json_codec, parses_objects) {
  auto error = std::string{};
  auto value = notary::encoding::json::try_parse_object(
      notary::testing::kNodePayloadJson, error);
  ASSERT_TRUE(value.has_value()) << error;
  EXPECT_EQ(*value, notary::testing::make_node_payload());
  EXPECT_TRUE(error.empty());
}

TEST(json_codec, rejects_duplicate_keys_and_trailing_content) {
  auto error = std::string{};
  EXPECT_FALSE(notary::encoding::json::try_parse(R"({"a":1,"a":2})", error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(
      notary::encoding::json::try_parse(R"({"a":1} {"b":2})", error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(notary::encoding::json::try_parse("// note\n{}", error)
                   .has_value());
}

TEST(json_codec, object_parse_rejects_other_roots) {
  auto error = std::string{};
  EXPECT_TRUE(notary::encoding::json::try_parse("[1,2]", error).has_value());
  EXPECT_FALSE(
      notary::encoding::json::try_parse_object("[1,2]", error).has_value());
  EXPECT_EQ(error, "expected JSON object");
}

TEST(json_codec, canonical_form_sorts_keys_without_whitespace) {
  auto value = Json::Value{Json::objectValue};
  value["zeta"] = 1;
  value["alpha"]["inner_b"] = true;
  value["alpha"]["inner_a"] = Json::Value{Json::nullValue};
  value["list"].append("x");
  value["list"].append(2);
  EXPECT_EQ(notary::encoding::json::write_canonical(value),
            R"({"alpha":{"inner_a":null,"inner_b":true},"list":["x",2],"zeta":1})");
}

TEST(json_codec, canonical_form_keeps_utf8) {
  auto value = Json::Value{Json::objectValue};
  value["alias"] = "n\xC3\xB8" "de";
  EXPECT_EQ(notary::encoding::json::write_canonical(value),
            "{\"alias\":\"n\xC3\xB8" "de\"}");
}

TEST(json_codec, pretty_form_round_trips) {
  auto payload = notary::testing::make_node_payload();
  auto error = std::string{};
  auto parsed = notary::encoding::json::try_parse_object(
      notary::encoding::json::write_pretty(payload), error);
  ASSERT_TRUE(parsed.has_value()) << error;
  EXPECT_EQ(*parsed, payload);
}
