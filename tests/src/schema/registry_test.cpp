#include <gtest/gtest.h>
#include <notary/schema/registry.hpp>

#include <string>
#include <vector>

TEST(registry, node_schema_requires_all_seven_fields_in_order) {
  const auto& schema =
      notary::schema::schema_for(notary::schema::transaction_type_t::node);
  auto names = std::vector<std::string>{};
  for (const auto& field : schema.fields) {
    EXPECT_TRUE(field.required) << field.name;
    names.emplace_back(field.name);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"node_ip", "node_port",
                                             "client_ip", "client_port",
                                             "alias", "services", "blskey"}));
  EXPECT_EQ(schema.code(), "0");
  EXPECT_EQ(schema.name(), "NODE");
}

TEST(registry, node_ports_are_bounded_integers) {
  const auto& schema =
      notary::schema::schema_for(notary::schema::transaction_type_t::node);
  auto port = notary::schema::find_field(schema, "node_port");
  ASSERT_TRUE(port.has_value());
  EXPECT_EQ(port->kind, notary::schema::field_kind_t::integer);
  EXPECT_EQ(port->minimum, 1);
  EXPECT_EQ(port->maximum, 65535);

  auto services = notary::schema::find_field(schema, "services");
  ASSERT_TRUE(services.has_value());
  EXPECT_EQ(services->kind, notary::schema::field_kind_t::list);
  ASSERT_EQ(services->allowed.size(), 2u);
  EXPECT_EQ(services->allowed[0], "VALIDATOR");
  EXPECT_EQ(services->allowed[1], "OBSERVER");
}

TEST(registry, resolves_names_and_codes) {
  EXPECT_EQ(notary::schema::try_resolve_type("NODE"),
            notary::schema::transaction_type_t::node);
  EXPECT_EQ(notary::schema::try_resolve_type("0"),
            notary::schema::transaction_type_t::node);
  EXPECT_EQ(notary::schema::try_resolve_type("NYM"),
            notary::schema::transaction_type_t::nym);
  EXPECT_EQ(notary::schema::try_resolve_type("105"),
            notary::schema::transaction_type_t::get_nym);
}

TEST(registry, unknown_types_fail_closed) {
  EXPECT_FALSE(notary::schema::try_resolve_type("ATTRIB").has_value());
  EXPECT_FALSE(notary::schema::try_resolve_type("node").has_value());
  EXPECT_FALSE(notary::schema::try_resolve_type("").has_value());
  EXPECT_FALSE(notary::schema::try_schema_for("9999").has_value());
  EXPECT_FALSE(notary::schema::is_supported(
      static_cast<notary::schema::transaction_type_t>(7)));
  EXPECT_TRUE(
      notary::schema::is_supported(notary::schema::transaction_type_t::get_nym));
}

TEST(registry, every_supported_type_has_a_matching_schema) {
  for (const auto type : notary::schema::supported_types()) {
    const auto& schema = notary::schema::schema_for(type);
    EXPECT_EQ(schema.type, type);
    auto by_code = notary::schema::try_schema_for(schema.code());
    ASSERT_TRUE(by_code.has_value());
    EXPECT_EQ(&by_code->get(), &schema);
  }
  EXPECT_EQ(notary::schema::supported_types().size(), 3u);
}

TEST(registry, kind_variant_matches_type) {
  auto kind = notary::schema::to_kind(notary::schema::transaction_type_t::nym);
  EXPECT_TRUE(std::holds_alternative<notary::schema::nym_t>(kind));
  kind = notary::schema::to_kind(notary::schema::transaction_type_t::get_nym);
  EXPECT_TRUE(std::holds_alternative<notary::schema::get_nym_t>(kind));
}

TEST(registry, get_nym_schema_has_no_fields) {
  const auto& schema =
      notary::schema::schema_for(notary::schema::transaction_type_t::get_nym);
  EXPECT_TRUE(schema.fields.empty());
  EXPECT_EQ(schema.code(), "105");
}
