#include <lexkey/conversion/temporal.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <chrono>
#include <cstdlib>

namespace lexkey::conversion {

namespace {

constexpr auto kNanosPerSecond = int64_t{1'000'000'000};
constexpr auto kNanosPerMilli = int64_t{1'000'000};
constexpr auto kSecondsPerDay = int64_t{86'400};

constexpr auto kLongMonths = std::array<std::string_view, 12>{
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};
constexpr auto kLongDays = std::array<std::string_view, 7>{
    "Sunday",   "Monday", "Tuesday", "Wednesday",
    "Thursday", "Friday", "Saturday"};

int64_t floor_div(const int64_t value, const int64_t divisor) {
  auto quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

// Broken-down wall clock time in the timestamp's own offset.
struct civil_time_t final {
  int year{};
  unsigned month{};
  unsigned day{};
  unsigned weekday{};
  int hour{};
  int minute{};
  int second{};
  int64_t nanos{};
  int32_t offset_seconds{};
};

civil_time_t to_civil(const schema::timestamp_t& timestamp) {
  auto local_seconds =
      floor_div(timestamp.unix_nanos, kNanosPerSecond) +
      timestamp.offset_seconds;
  auto nanos = timestamp.unix_nanos -
               floor_div(timestamp.unix_nanos, kNanosPerSecond) *
                   kNanosPerSecond;
  auto days = floor_div(local_seconds, kSecondsPerDay);
  auto second_of_day = local_seconds - days * kSecondsPerDay;

  auto day_point = std::chrono::sys_days{std::chrono::days{days}};
  auto date = std::chrono::year_month_day{day_point};
  auto weekday = std::chrono::weekday{day_point};

  return civil_time_t{
      .year = static_cast<int>(date.year()),
      .month = static_cast<unsigned>(date.month()),
      .day = static_cast<unsigned>(date.day()),
      .weekday = weekday.c_encoding(),
      .hour = static_cast<int>(second_of_day / 3600),
      .minute = static_cast<int>((second_of_day % 3600) / 60),
      .second = static_cast<int>(second_of_day % 60),
      .nanos = nanos,
      .offset_seconds = timestamp.offset_seconds};
}

void append_offset(std::string& out,
                   const int32_t offset_seconds,
                   const bool z_for_utc,
                   const bool colon,
                   const bool minutes) {
  if (z_for_utc && offset_seconds == 0) {
    out.push_back('Z');
    return;
  }
  auto sign = offset_seconds < 0 ? '-' : '+';
  auto magnitude = std::abs(offset_seconds) / 60;
  out += fmt::format("{}{:02}", sign, magnitude / 60);
  if (!minutes) {
    return;
  }
  if (colon) {
    out.push_back(':');
  }
  out += fmt::format("{:02}", magnitude % 60);
}

// ".000" keeps every digit; ".999" trims trailing zeros and drops the dot
// when nothing is left.
void append_fraction(std::string& out,
                     const int64_t nanos,
                     const std::size_t digits,
                     const bool trim) {
  auto text = fmt::format("{:09}", nanos).substr(0, digits);
  if (trim) {
    auto last = text.find_last_not_of('0');
    if (last == std::string::npos) {
      return;
    }
    text.resize(last + 1);
  }
  out.push_back('.');
  out += text;
}

// Length of a run of `digit` starting at `position`, only when it forms a
// fractional-second token (not followed by another digit).
std::size_t fraction_run(const std::string_view layout,
                         const std::size_t position,
                         const char digit) {
  auto end = position;
  while (end < layout.size() && layout[end] == digit) {
    ++end;
  }
  if (end == position) {
    return 0;
  }
  if (end < layout.size() && layout[end] >= '0' && layout[end] <= '9') {
    return 0;
  }
  return end - position;
}

}  // namespace

schema::timestamp_t to_utc(const schema::timestamp_t& timestamp) {
  return schema::timestamp_t{.unix_nanos = timestamp.unix_nanos,
                             .offset_seconds = 0};
}

int64_t unix_seconds(const schema::timestamp_t& timestamp) {
  return floor_div(timestamp.unix_nanos, kNanosPerSecond);
}

int64_t unix_millis(const schema::timestamp_t& timestamp) {
  return floor_div(timestamp.unix_nanos, kNanosPerMilli);
}

int64_t unix_nanos(const schema::timestamp_t& timestamp) {
  return timestamp.unix_nanos;
}

std::string format_layout(const schema::timestamp_t& timestamp,
                          const std::string_view layout) {
  auto civil = to_civil(timestamp);
  auto hour12 = civil.hour % 12 == 0 ? 12 : civil.hour % 12;
  auto out = std::string{};
  out.reserve(layout.size() + 8);

  auto position = std::size_t{0};
  while (position < layout.size()) {
    auto rest = layout.substr(position);
    auto take = [&](const std::string_view token) {
      if (!rest.starts_with(token)) {
        return false;
      }
      position += token.size();
      return true;
    };

    if (take("January")) {
      out += kLongMonths[civil.month - 1];
    } else if (take("Jan")) {
      out += kLongMonths[civil.month - 1].substr(0, 3);
    } else if (take("Monday")) {
      out += kLongDays[civil.weekday];
    } else if (take("Mon")) {
      out += kLongDays[civil.weekday].substr(0, 3);
    } else if (take("2006")) {
      out += fmt::format("{:04}", civil.year);
    } else if (take("Z07:00")) {
      append_offset(out, civil.offset_seconds, true, true, true);
    } else if (take("Z0700")) {
      append_offset(out, civil.offset_seconds, true, false, true);
    } else if (take("Z07")) {
      append_offset(out, civil.offset_seconds, true, false, false);
    } else if (take("-07:00")) {
      append_offset(out, civil.offset_seconds, false, true, true);
    } else if (take("-0700")) {
      append_offset(out, civil.offset_seconds, false, false, true);
    } else if (take("-07")) {
      append_offset(out, civil.offset_seconds, false, false, false);
    } else if (take("01")) {
      out += fmt::format("{:02}", civil.month);
    } else if (take("02")) {
      out += fmt::format("{:02}", civil.day);
    } else if (take("03")) {
      out += fmt::format("{:02}", hour12);
    } else if (take("04")) {
      out += fmt::format("{:02}", civil.minute);
    } else if (take("05")) {
      out += fmt::format("{:02}", civil.second);
    } else if (take("06")) {
      out += fmt::format("{:02}", ((civil.year % 100) + 100) % 100);
    } else if (take("15")) {
      out += fmt::format("{:02}", civil.hour);
    } else if (take("_2")) {
      out += fmt::format("{:>2}", civil.day);
    } else if (take("PM")) {
      out += civil.hour >= 12 ? "PM" : "AM";
    } else if (take("pm")) {
      out += civil.hour >= 12 ? "pm" : "am";
    } else if (take("1")) {
      out += fmt::format("{}", civil.month);
    } else if (take("2")) {
      out += fmt::format("{}", civil.day);
    } else if (take("3")) {
      out += fmt::format("{}", hour12);
    } else if (take("4")) {
      out += fmt::format("{}", civil.minute);
    } else if (take("5")) {
      out += fmt::format("{}", civil.second);
    } else if (rest.starts_with('.') &&
               fraction_run(layout, position + 1, '0') > 0) {
      auto digits = fraction_run(layout, position + 1, '0');
      append_fraction(out, civil.nanos, digits, false);
      position += digits + 1;
    } else if (rest.starts_with('.') &&
               fraction_run(layout, position + 1, '9') > 0) {
      auto digits = fraction_run(layout, position + 1, '9');
      append_fraction(out, civil.nanos, digits, true);
      position += digits + 1;
    } else {
      out.push_back(layout[position]);
      ++position;
    }
  }
  return out;
}

std::string format_rfc3339(const schema::timestamp_t& timestamp) {
  return format_layout(timestamp, kRfc3339Layout);
}

std::string format_rfc3339_fixed(const schema::timestamp_t& timestamp) {
  return format_layout(timestamp, kRfc3339FixedLayout);
}

std::string format_rfc3339_nano(const schema::timestamp_t& timestamp) {
  return format_layout(timestamp, kRfc3339NanoLayout);
}

}  // namespace lexkey::conversion
