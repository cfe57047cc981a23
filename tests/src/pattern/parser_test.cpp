#include <gtest/gtest.h>
#include <lexkey/pattern/parser.hpp>
#include <lexkey/testing/common.hpp>

#include <string>
#include <variant>
#include <vector>

using lexkey::pattern::field_ref_t;
using lexkey::pattern::literal_segment_t;
using lexkey::pattern::parse;
using lexkey::schema::attribute_kind_t;
using lexkey::schema::error_code_t;
using lexkey::testing::error_code;
using lexkey::testing::parse_ok;

TEST(parser, constant_pattern_is_a_single_literal) {
  auto spec = parse_ok("PROFILE");
  EXPECT_TRUE(spec.is_constant());
  ASSERT_EQ(spec.segments().size(), 1u);
  EXPECT_EQ(std::get<literal_segment_t>(spec.segments()[0]).value, "PROFILE");
  EXPECT_EQ(spec.literal_prefix(), "PROFILE");
  EXPECT_TRUE(spec.field_refs().empty());
}

TEST(parser, literal_prefix_then_field_reference) {
  auto spec = parse_ok("USER#{id}");
  EXPECT_FALSE(spec.is_constant());
  ASSERT_EQ(spec.segments().size(), 2u);
  EXPECT_EQ(std::get<literal_segment_t>(spec.segments()[0]).value, "USER#");
  const auto& ref = std::get<field_ref_t>(spec.segments()[1]);
  EXPECT_EQ(ref.path, "id");
  EXPECT_TRUE(ref.modifiers.empty());
  EXPECT_FALSE(ref.width_spec.has_value());
  EXPECT_EQ(ref.offset, 5u);
  EXPECT_EQ(spec.literal_prefix(), "USER#");
}

TEST(parser, preserves_field_order) {
  auto spec = parse_ok("ORDER#{tenant}#{id}");
  ASSERT_EQ(spec.segments().size(), 4u);
  EXPECT_EQ(spec.field_paths(), (std::vector<std::string>{"tenant", "id"}));
  EXPECT_EQ(std::get<literal_segment_t>(spec.segments()[2]).value, "#");
}

TEST(parser, pattern_starting_with_reference_has_empty_prefix) {
  auto spec = parse_ok("{tenant}#{id}");
  EXPECT_EQ(spec.literal_prefix(), "");
  EXPECT_EQ(spec.segments().size(), 3u);
}

TEST(parser, trailing_literal_is_kept) {
  auto spec = parse_ok("{id}#META");
  ASSERT_EQ(spec.segments().size(), 2u);
  EXPECT_EQ(std::get<literal_segment_t>(spec.segments()[1]).value, "#META");
}

TEST(parser, splits_modifiers_and_width_spec) {
  auto spec = parse_ok("TS#{created:utc:unixnano:%020d}");
  auto ref = spec.field_refs().front();
  EXPECT_EQ(ref.path, "created");
  EXPECT_EQ(ref.modifiers, (std::vector<std::string>{"utc", "unixnano"}));
  EXPECT_EQ(ref.width_spec, "%020d");
}

TEST(parser, lone_width_spec_is_not_a_modifier) {
  auto ref = parse_ok("{count:%05d}").field_refs().front();
  EXPECT_TRUE(ref.modifiers.empty());
  EXPECT_EQ(ref.width_spec, "%05d");
}

TEST(parser, only_last_token_can_be_a_width_spec) {
  auto ref = parse_ok("{price:%.2f:x}").field_refs().front();
  EXPECT_EQ(ref.modifiers, (std::vector<std::string>{"%.2f", "x"}));
  EXPECT_FALSE(ref.width_spec.has_value());
}

TEST(parser, raw_text_is_preserved) {
  auto raw = std::string{"A#{b.c:rfc3339}#{d:%03d}#E"};
  EXPECT_EQ(parse_ok(raw).raw(), raw);
  EXPECT_EQ(parse_ok(raw), parse_ok(raw));
}

TEST(parser, rejects_empty_pattern) {
  auto parsed = parse("");
  EXPECT_EQ(error_code(parsed), error_code_t::empty_pattern);
  EXPECT_EQ(lexkey::schema::error_of(parsed).offset, 0u);
}

TEST(parser, rejects_empty_field_reference) {
  auto parsed = parse("USER#{}");
  EXPECT_EQ(error_code(parsed), error_code_t::empty_field_reference);
  EXPECT_EQ(lexkey::schema::error_of(parsed).offset, 5u);
}

TEST(parser, rejects_empty_path_component) {
  auto parsed = parse("USER#{a..b}");
  EXPECT_EQ(error_code(parsed), error_code_t::invalid_field_path);
  EXPECT_EQ(lexkey::schema::error_of(parsed).offset, 8u);
  EXPECT_EQ(error_code(parse("{.a}")), error_code_t::invalid_field_path);
  EXPECT_EQ(error_code(parse("{a.}")), error_code_t::invalid_field_path);
}

TEST(parser, rejects_unbalanced_braces) {
  EXPECT_EQ(error_code(parse("USER#{id")), error_code_t::unbalanced_brace);
  EXPECT_EQ(error_code(parse("USER#id}")), error_code_t::unbalanced_brace);
  EXPECT_EQ(error_code(parse("{a{b}}")), error_code_t::unbalanced_brace);
}

TEST(parser, binary_constant_must_be_base64) {
  auto spec = parse_ok("AQID", attribute_kind_t::binary);
  EXPECT_TRUE(spec.is_constant());
  EXPECT_EQ(spec.kind(), attribute_kind_t::binary);
  EXPECT_EQ(error_code(parse("not base64!", attribute_kind_t::binary)),
            error_code_t::invalid_binary_literal);
}

TEST(parser, binary_pattern_with_fields_is_not_decoded) {
  auto spec = parse_ok("ID#{id}", attribute_kind_t::binary);
  EXPECT_FALSE(spec.is_constant());
}

TEST(parser_death, must_parse_terminates_on_invalid_pattern) {
  EXPECT_DEATH(lexkey::pattern::must_parse("USER#{}"), "");
}
