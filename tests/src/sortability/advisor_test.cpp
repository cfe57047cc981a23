#include <gtest/gtest.h>
#include <lexkey/sortability/advisor.hpp>
#include <lexkey/testing/common.hpp>

using lexkey::schema::semantic_type_t;
using lexkey::sortability::check_sort_safety;
using lexkey::sortability::unsafe_condition_t;

namespace {

std::optional<lexkey::sortability::diagnostic_t> check(
    const std::string_view raw,
    const semantic_type_t type) {
  auto ref = lexkey::testing::parse_ok(raw).field_refs().front();
  return check_sort_safety(ref, type, "Order");
}

}  // namespace

TEST(sortability, unpadded_integer_is_flagged) {
  auto diagnostic = check("{count}", semantic_type_t::signed_integer);
  ASSERT_TRUE(diagnostic.has_value());
  EXPECT_EQ(diagnostic->condition, unsafe_condition_t::unpadded_integer);
  EXPECT_EQ(diagnostic->entity_label, "Order");
  EXPECT_EQ(diagnostic->field_path, "count");
  EXPECT_NE(diagnostic->suggestion.find("{count:%020d}"), std::string::npos);
  EXPECT_NE(diagnostic->message().find("Order sort key field count"),
            std::string::npos);
}

TEST(sortability, padded_integer_is_safe) {
  EXPECT_FALSE(check("{count:%020d}", semantic_type_t::signed_integer));
  EXPECT_FALSE(check("{count:%05d}", semantic_type_t::unsigned_integer));
}

TEST(sortability, space_padding_is_not_zero_padding) {
  EXPECT_TRUE(check("{count:%5d}", semantic_type_t::signed_integer));
  EXPECT_TRUE(check("{count:%-20d}", semantic_type_t::signed_integer));
}

TEST(sortability, zero_flag_without_width_is_flagged) {
  auto integer = check("{count:%0d}", semantic_type_t::signed_integer);
  ASSERT_TRUE(integer.has_value());
  EXPECT_EQ(integer->condition, unsafe_condition_t::unpadded_integer);

  auto floating = check("{price:%0.2f}", semantic_type_t::floating_point);
  ASSERT_TRUE(floating.has_value());
  EXPECT_EQ(floating->condition, unsafe_condition_t::unpadded_float);

  auto epoch = check("{ts:unix:%0d}", semantic_type_t::temporal);
  ASSERT_TRUE(epoch.has_value());
  EXPECT_EQ(epoch->condition, unsafe_condition_t::unpadded_epoch_counter);
}

TEST(sortability, float_without_total_width_is_flagged) {
  auto diagnostic = check("{price:.2f}", semantic_type_t::floating_point);
  ASSERT_TRUE(diagnostic.has_value());
  EXPECT_EQ(diagnostic->condition, unsafe_condition_t::unpadded_float);
  EXPECT_NE(diagnostic->cause.find(".2f"), std::string::npos);
  EXPECT_FALSE(check("{price:%020.2f}", semantic_type_t::floating_point));
}

TEST(sortability, epoch_counters_need_padding) {
  auto seconds = check("{ts:unix}", semantic_type_t::temporal);
  ASSERT_TRUE(seconds.has_value());
  EXPECT_EQ(seconds->condition, unsafe_condition_t::unpadded_epoch_counter);
  EXPECT_NE(seconds->cause.find("9 digits before 2001-09-09, 10 after"),
            std::string::npos);
  EXPECT_NE(seconds->suggestion.find("%011d"), std::string::npos);

  auto millis = check("{ts:unixmilli}", semantic_type_t::temporal);
  ASSERT_TRUE(millis.has_value());
  EXPECT_NE(millis->suggestion.find("%014d"), std::string::npos);

  auto nanos = check("{ts:unixnano}", semantic_type_t::temporal);
  ASSERT_TRUE(nanos.has_value());
  EXPECT_NE(nanos->cause.find("18 digits"), std::string::npos);
  EXPECT_NE(nanos->suggestion.find("%020d"), std::string::npos);

  EXPECT_FALSE(check("{ts:unixnano:%020d}", semantic_type_t::temporal));
}

TEST(sortability, variable_width_timestamps_are_always_flagged) {
  auto rfc = check("{ts:rfc3339}", semantic_type_t::temporal);
  ASSERT_TRUE(rfc.has_value());
  EXPECT_EQ(rfc->condition, unsafe_condition_t::variable_width_timestamp);
  auto nano = check("{ts:utc:rfc3339nano}", semantic_type_t::temporal);
  ASSERT_TRUE(nano.has_value());
  EXPECT_EQ(nano->condition, unsafe_condition_t::variable_width_timestamp);
}

TEST(sortability, fixed_timestamp_needs_utc) {
  auto diagnostic = check("{ts:rfc3339fixed}", semantic_type_t::temporal);
  ASSERT_TRUE(diagnostic.has_value());
  EXPECT_EQ(diagnostic->condition,
            unsafe_condition_t::timezone_dependent_timestamp);
  EXPECT_FALSE(check("{ts:utc:rfc3339fixed}", semantic_type_t::temporal));
}

TEST(sortability, text_and_layouts_are_not_flagged) {
  EXPECT_FALSE(check("{name}", semantic_type_t::text));
  EXPECT_FALSE(check("{day:2006-01-02}", semantic_type_t::temporal));
  EXPECT_FALSE(check("{status}", semantic_type_t::other));
}

TEST(sortability, compound_patterns_check_each_reference) {
  auto spec =
      lexkey::testing::parse_ok("ORDER#{placed:rfc3339}#{seq}#{name}");
  auto field_types = lexkey::schema::field_type_table_t{
      {"placed", "time.Time"}, {"seq", "uint32"}, {"name", "string"}};
  auto diagnostics = check_sort_safety(spec, field_types, "Order");
  ASSERT_EQ(diagnostics.size(), 2u);
  EXPECT_EQ(diagnostics[0].field_path, "placed");
  EXPECT_EQ(diagnostics[0].condition,
            unsafe_condition_t::variable_width_timestamp);
  EXPECT_EQ(diagnostics[1].field_path, "seq");
  EXPECT_EQ(diagnostics[1].condition, unsafe_condition_t::unpadded_integer);
}
