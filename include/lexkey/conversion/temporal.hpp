#pragma once

#include <lexkey/schema/field_value.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Timestamp rendering. Layouts are written against the reference time
// Mon Jan 2 15:04:05 -0700 2006, e.g. "2006-01-02" or "20060102T150405".
namespace lexkey::conversion {

inline constexpr auto kRfc3339Layout =
    std::string_view{"2006-01-02T15:04:05Z07:00"};
inline constexpr auto kRfc3339FixedLayout =
    std::string_view{"2006-01-02T15:04:05.000000000Z07:00"};
inline constexpr auto kRfc3339NanoLayout =
    std::string_view{"2006-01-02T15:04:05.999999999Z07:00"};

/// Same instant, observed in UTC.
schema::timestamp_t to_utc(const schema::timestamp_t& timestamp);

// Epoch counters round toward negative infinity.
int64_t unix_seconds(const schema::timestamp_t& timestamp);
int64_t unix_millis(const schema::timestamp_t& timestamp);
int64_t unix_nanos(const schema::timestamp_t& timestamp);

std::string format_layout(const schema::timestamp_t& timestamp,
                          std::string_view layout);

std::string format_rfc3339(const schema::timestamp_t& timestamp);
std::string format_rfc3339_fixed(const schema::timestamp_t& timestamp);
std::string format_rfc3339_nano(const schema::timestamp_t& timestamp);

}  // namespace lexkey::conversion
