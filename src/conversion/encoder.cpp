#include <lexkey/conversion/encoder.hpp>
#include <lexkey/conversion/temporal.hpp>
#include <lexkey/conversion/width_spec.hpp>
#include <lexkey/schema/primitives.hpp>

#include <fmt/format.h>
#include <fmt/printf.h>

#include <string_view>

using lexkey::schema::error_code_t;
using lexkey::schema::field_value_t;
using lexkey::schema::make_error;
using lexkey::schema::timestamp_t;

namespace lexkey::conversion {

namespace {

using string_result_t = schema::result_t<std::string>;

std::string_view value_type_name(const field_value_t& value) {
  return std::visit(
      overloaded{[](const std::string&) { return std::string_view{"text"}; },
                 [](const int64_t) { return std::string_view{"int64"}; },
                 [](const uint64_t) { return std::string_view{"uint64"}; },
                 [](const double) { return std::string_view{"double"}; },
                 [](const timestamp_t&) {
                   return std::string_view{"timestamp"};
                 },
                 [](const bool) { return std::string_view{"bool"}; }},
      value);
}

schema::key_error_t mismatch(const conversion_descriptor_t& descriptor,
                             const field_value_t& value) {
  return make_error(
      error_code_t::value_type_mismatch,
      fmt::format("{} value cannot be converted with {}{}",
                  value_type_name(value),
                  to_string(descriptor.expression.transform),
                  descriptor.expression.format
                      ? fmt::format(" \"{}\"", *descriptor.expression.format)
                      : std::string{}));
}

template <typename T>
string_result_t sprintf_checked(const std::string& format, const T& value) {
  try {
    return fmt::sprintf(format, value);
  } catch (const fmt::format_error& ex) {
    return make_error(error_code_t::value_type_mismatch,
                      fmt::format("\"{}\": {}", format, ex.what()));
  }
}

string_result_t encode_printf(const conversion_descriptor_t& descriptor,
                              const field_value_t& value) {
  const auto& format = *descriptor.expression.format;
  auto spec = parse_width_spec(format);
  if (!schema::is_ok(spec)) {
    return schema::error_of(spec);
  }
  auto conversion = schema::value_of(spec).conversion;

  if (std::string_view{"dioxX"}.find(conversion) != std::string_view::npos) {
    if (const auto* signed_value = std::get_if<int64_t>(&value)) {
      return sprintf_checked(format, *signed_value);
    }
    if (const auto* unsigned_value = std::get_if<uint64_t>(&value)) {
      return sprintf_checked(format, *unsigned_value);
    }
    return mismatch(descriptor, value);
  }
  if (std::string_view{"fFeEgG"}.find(conversion) != std::string_view::npos) {
    if (const auto* real = std::get_if<double>(&value)) {
      return sprintf_checked(format, *real);
    }
    if (const auto* signed_value = std::get_if<int64_t>(&value)) {
      return sprintf_checked(format, static_cast<double>(*signed_value));
    }
    if (const auto* unsigned_value = std::get_if<uint64_t>(&value)) {
      return sprintf_checked(format, static_cast<double>(*unsigned_value));
    }
    return mismatch(descriptor, value);
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return sprintf_checked(format, *text);
  }
  return mismatch(descriptor, value);
}

string_result_t encode_epoch(const conversion_descriptor_t& descriptor,
                             const timestamp_t& timestamp) {
  auto count = int64_t{};
  switch (descriptor.expression.transform) {
    case transform_t::epoch_seconds:
      count = unix_seconds(timestamp);
      break;
    case transform_t::epoch_millis:
      count = unix_millis(timestamp);
      break;
    default:
      count = unix_nanos(timestamp);
      break;
  }
  if (!descriptor.expression.format) {
    return fmt::format("{}", count);
  }
  return sprintf_checked(*descriptor.expression.format, count);
}

string_result_t encode_temporal(const conversion_descriptor_t& descriptor,
                                const field_value_t& value) {
  const auto* observed = std::get_if<timestamp_t>(&value);
  if (observed == nullptr) {
    return mismatch(descriptor, value);
  }
  auto timestamp =
      descriptor.expression.utc_normalize ? to_utc(*observed) : *observed;
  switch (descriptor.expression.transform) {
    case transform_t::epoch_seconds:
    case transform_t::epoch_millis:
    case transform_t::epoch_nanos:
      return encode_epoch(descriptor, timestamp);
    case transform_t::rfc3339:
      return format_rfc3339(timestamp);
    case transform_t::rfc3339_fixed:
      return format_rfc3339_fixed(timestamp);
    case transform_t::rfc3339_nano:
      return format_rfc3339_nano(timestamp);
    default:
      return format_layout(timestamp,
                           descriptor.expression.format.value_or(""));
  }
}

}  // namespace

std::string to_display_string(const field_value_t& value) {
  return std::visit(
      overloaded{[](const std::string& text) { return text; },
                 [](const int64_t number) { return fmt::format("{}", number); },
                 [](const uint64_t number) {
                   return fmt::format("{}", number);
                 },
                 [](const double number) { return fmt::format("{}", number); },
                 [](const timestamp_t& timestamp) {
                   return format_rfc3339_nano(timestamp);
                 },
                 [](const bool flag) {
                   return std::string{flag ? "true" : "false"};
                 }},
      value);
}

string_result_t encode(const conversion_descriptor_t& descriptor,
                       const field_value_t& value) {
  switch (descriptor.expression.transform) {
    case transform_t::identity:
      if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
      }
      return mismatch(descriptor, value);
    case transform_t::printf_format:
      return encode_printf(descriptor, value);
    case transform_t::decimal:
      if (std::holds_alternative<int64_t>(value) ||
          std::holds_alternative<uint64_t>(value)) {
        return to_display_string(value);
      }
      return mismatch(descriptor, value);
    case transform_t::best_effort_string:
      return to_display_string(value);
    default:
      return encode_temporal(descriptor, value);
  }
}

}  // namespace lexkey::conversion
