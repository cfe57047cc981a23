#pragma once

#include <lexkey/common/enum_string.hpp>
#include <lexkey/conversion/value_source.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lexkey::conversion {

enum class transform_t : uint8_t {
  identity = 0,
  printf_format = 1,
  decimal = 2,
  epoch_seconds = 3,
  epoch_millis = 4,
  epoch_nanos = 5,
  rfc3339 = 6,
  rfc3339_fixed = 7,
  rfc3339_nano = 8,
  custom_layout = 9,
  best_effort_string = 10
};

inline constexpr auto kTransformMappings = std::array{
    std::pair<std::string_view, transform_t>{"identity", transform_t::identity},
    std::pair<std::string_view, transform_t>{"printf_format",
                                             transform_t::printf_format},
    std::pair<std::string_view, transform_t>{"decimal", transform_t::decimal},
    std::pair<std::string_view, transform_t>{"epoch_seconds",
                                             transform_t::epoch_seconds},
    std::pair<std::string_view, transform_t>{"epoch_millis",
                                             transform_t::epoch_millis},
    std::pair<std::string_view, transform_t>{"epoch_nanos",
                                             transform_t::epoch_nanos},
    std::pair<std::string_view, transform_t>{"rfc3339", transform_t::rfc3339},
    std::pair<std::string_view, transform_t>{"rfc3339_fixed",
                                             transform_t::rfc3339_fixed},
    std::pair<std::string_view, transform_t>{"rfc3339_nano",
                                             transform_t::rfc3339_nano},
    std::pair<std::string_view, transform_t>{"custom_layout",
                                             transform_t::custom_layout},
    std::pair<std::string_view, transform_t>{"best_effort_string",
                                             transform_t::best_effort_string}};

inline constexpr std::string_view to_string(const transform_t value) {
  return lexkey::common::to_string(value, kTransformMappings)
      .value_or("unknown");
}

inline constexpr bool is_temporal(const transform_t transform) {
  switch (transform) {
    case transform_t::epoch_seconds:
    case transform_t::epoch_millis:
    case transform_t::epoch_nanos:
    case transform_t::rfc3339:
    case transform_t::rfc3339_fixed:
    case transform_t::rfc3339_nano:
    case transform_t::custom_layout:
      return true;
    default:
      return false;
  }
}

/// What to do with a value to get its key text.
///
/// `format` is the printf spec for `printf_format` and the zero-padding
/// spec (if any) for epoch counters; for `custom_layout` it is the layout.
/// `utc_normalize` drops the observed offset before formatting.
struct conversion_expression_t final {
  transform_t transform{transform_t::identity};
  value_source_t source;
  std::optional<std::string> format;
  bool utc_normalize{false};

  bool operator==(const conversion_expression_t&) const = default;
};

struct conversion_descriptor_t final {
  conversion_expression_t expression;
  bool requires_numeric_library{false};
  bool requires_temporal_library{false};

  /// Text pass-through: the value is used as is, no conversion call.
  bool is_string_build() const {
    return expression.transform == transform_t::identity;
  }

  bool operator==(const conversion_descriptor_t&) const = default;
};

}  // namespace lexkey::conversion
