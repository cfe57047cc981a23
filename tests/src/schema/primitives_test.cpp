#include <gtest/gtest.h>
#include <lexkey/schema/attribute_kind.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/primitives.hpp>
#include <lexkey/schema/semantic_type.hpp>

TEST(primitives, base64_round_trips_bytes) {
  auto payload = lexkey::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = lexkey::schema::to_base64(payload);
  EXPECT_EQ(encoded, "AQID/v8=");
  EXPECT_EQ(lexkey::schema::from_base64(encoded), payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(lexkey::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(lexkey::schema::try_from_base64("AQ=D").has_value());
  EXPECT_FALSE(lexkey::schema::try_from_base64("AQI").has_value());
}

TEST(primitives, split_keeps_empty_components) {
  auto parts = lexkey::schema::split("a..b", '.');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "");
  EXPECT_EQ(parts[2], "b");
  EXPECT_EQ(lexkey::schema::join(parts, "."), "a..b");
}

TEST(primitives, classify_recognises_schema_and_cpp_type_names) {
  using lexkey::schema::classify;
  using lexkey::schema::semantic_type_t;
  EXPECT_EQ(classify("string"), semantic_type_t::text);
  EXPECT_EQ(classify("std::string"), semantic_type_t::text);
  EXPECT_EQ(classify("int64"), semantic_type_t::signed_integer);
  EXPECT_EQ(classify("int32_t"), semantic_type_t::signed_integer);
  EXPECT_EQ(classify("uint64"), semantic_type_t::unsigned_integer);
  EXPECT_EQ(classify("float64"), semantic_type_t::floating_point);
  EXPECT_EQ(classify("double"), semantic_type_t::floating_point);
  EXPECT_EQ(classify("time.Time"), semantic_type_t::temporal);
  EXPECT_EQ(classify("Status"), semantic_type_t::other);
}

TEST(primitives, enum_names_map_both_ways) {
  EXPECT_EQ(lexkey::schema::to_string(
                lexkey::schema::error_code_t::unbalanced_brace),
            "unbalanced_brace");
  EXPECT_EQ(lexkey::common::try_from_string<lexkey::schema::error_code_t>(
                "field_not_found"),
            lexkey::schema::error_code_t::field_not_found);
  EXPECT_EQ(lexkey::common::try_from_string<lexkey::schema::attribute_kind_t>(
                "B"),
            lexkey::schema::attribute_kind_t::binary);
  EXPECT_FALSE(
      lexkey::common::try_from_string<lexkey::schema::attribute_kind_t>("X")
          .has_value());
}

TEST(primitives, wrap_error_prefixes_context_and_keeps_code) {
  auto error = lexkey::schema::wrap_error(
      "sort key", lexkey::schema::make_error(
                      lexkey::schema::error_code_t::unknown_field, "no such field"));
  EXPECT_EQ(error.code, lexkey::schema::error_code_t::unknown_field);
  EXPECT_EQ(error.message, "sort key: no such field");
}
