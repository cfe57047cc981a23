#include <gtest/gtest.h>
#include <lexkey/conversion/temporal.hpp>
#include <lexkey/testing/common.hpp>

using namespace lexkey::conversion;
using lexkey::testing::kSampleUnixNanos;
using lexkey::testing::make_timestamp;

TEST(temporal, rfc3339_prints_z_for_utc) {
  EXPECT_EQ(format_rfc3339(make_timestamp(kSampleUnixNanos)),
            "2023-11-14T22:13:20Z");
  EXPECT_EQ(format_rfc3339(make_timestamp(0)), "1970-01-01T00:00:00Z");
}

TEST(temporal, rfc3339_uses_observed_offset) {
  auto timestamp = make_timestamp(kSampleUnixNanos, 5 * 3600 + 30 * 60);
  EXPECT_EQ(format_rfc3339(timestamp), "2023-11-15T03:43:20+05:30");
  EXPECT_EQ(format_rfc3339(to_utc(timestamp)), "2023-11-14T22:13:20Z");
  EXPECT_EQ(format_rfc3339(make_timestamp(kSampleUnixNanos, -7 * 3600)),
            "2023-11-14T15:13:20-07:00");
}

TEST(temporal, fixed_keeps_nine_fraction_digits) {
  auto timestamp = make_timestamp(kSampleUnixNanos + 123'000'000);
  EXPECT_EQ(format_rfc3339_fixed(timestamp),
            "2023-11-14T22:13:20.123000000Z");
  EXPECT_EQ(format_rfc3339_fixed(make_timestamp(kSampleUnixNanos)),
            "2023-11-14T22:13:20.000000000Z");
}

TEST(temporal, nano_strips_trailing_zeros) {
  EXPECT_EQ(format_rfc3339_nano(make_timestamp(kSampleUnixNanos + 123'000'000)),
            "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(format_rfc3339_nano(make_timestamp(kSampleUnixNanos)),
            "2023-11-14T22:13:20Z");
}

TEST(temporal, epoch_counters_floor_before_1970) {
  EXPECT_EQ(unix_seconds(make_timestamp(kSampleUnixNanos + 999)), 1'700'000'000);
  EXPECT_EQ(unix_millis(make_timestamp(kSampleUnixNanos + 123'456'789)),
            1'700'000'000'123);
  EXPECT_EQ(unix_seconds(make_timestamp(-1)), -1);
  EXPECT_EQ(unix_millis(make_timestamp(-1)), -1);
  EXPECT_EQ(unix_nanos(make_timestamp(-1)), -1);
  EXPECT_EQ(format_rfc3339_fixed(make_timestamp(-1)),
            "1969-12-31T23:59:59.999999999Z");
}

TEST(temporal, layout_tokens) {
  auto timestamp = make_timestamp(kSampleUnixNanos);
  EXPECT_EQ(format_layout(timestamp, "2006-01-02"), "2023-11-14");
  EXPECT_EQ(format_layout(timestamp, "20060102T150405"), "20231114T221320");
  EXPECT_EQ(format_layout(timestamp, "Jan _2 15:04:05"), "Nov 14 22:13:20");
  EXPECT_EQ(format_layout(timestamp, "Monday, January 2"),
            "Tuesday, November 14");
  EXPECT_EQ(format_layout(timestamp, "Mon 3:04PM"), "Tue 10:13PM");
  EXPECT_EQ(format_layout(timestamp, "06/1/2"), "23/11/14");
  EXPECT_EQ(format_layout(timestamp, "15:04 -0700"), "22:13 +0000");
}

TEST(temporal, layout_fractions) {
  auto timestamp = make_timestamp(kSampleUnixNanos + 120'000'000);
  EXPECT_EQ(format_layout(timestamp, "05.000"), "20.120");
  EXPECT_EQ(format_layout(timestamp, "05.999"), "20.12");
  EXPECT_EQ(format_layout(make_timestamp(kSampleUnixNanos), "05.999"), "20");
}
