#include <gtest/gtest.h>
#include <lexkey/schema/attribute_value.hpp>

using namespace lexkey::schema;

TEST(attribute_value, equality_compares_nested_maps_deeply) {
  auto lhs = make_map_attribute(
      {{"user", make_map_attribute({{"id", make_string_attribute("u1")}})}});
  auto rhs = make_map_attribute(
      {{"user", make_map_attribute({{"id", make_string_attribute("u1")}})}});
  auto other = make_map_attribute(
      {{"user", make_map_attribute({{"id", make_string_attribute("u2")}})}});
  EXPECT_EQ(lhs, rhs);
  EXPECT_FALSE(lhs == other);
}

TEST(attribute_value, string_and_number_with_same_text_differ) {
  EXPECT_FALSE(make_string_attribute("42") == make_number_attribute("42"));
}

TEST(attribute_value, key_kind_only_for_scalar_key_types) {
  EXPECT_EQ(key_kind_of(make_string_attribute("a")), attribute_kind_t::string);
  EXPECT_EQ(key_kind_of(make_number_attribute("1")), attribute_kind_t::number);
  EXPECT_EQ(key_kind_of(make_binary_attribute({0x01})),
            attribute_kind_t::binary);
  EXPECT_FALSE(key_kind_of(make_bool_attribute(true)).has_value());
  EXPECT_FALSE(key_kind_of(make_null_attribute()).has_value());
  EXPECT_FALSE(key_kind_of(make_list_attribute({})).has_value());
}

TEST(attribute_value, as_map_returns_entries_for_maps_only) {
  auto map = make_map_attribute({{"a", make_string_attribute("b")}});
  ASSERT_NE(as_map(map), nullptr);
  EXPECT_EQ(as_map(map)->size(), 1u);
  EXPECT_EQ(as_map(make_string_attribute("a")), nullptr);
  EXPECT_EQ(type_tag(map), "M");
  EXPECT_EQ(type_tag(make_bool_attribute(false)), "BOOL");
}
