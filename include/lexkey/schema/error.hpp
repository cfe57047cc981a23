#pragma once

#include <lexkey/common/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// Schema type: error.
// Stable error codes for pattern compilation, conversion, index assembly and
// extraction. Failures are returned as values, never logged by the core.
namespace lexkey::schema {

enum class error_code_t : uint32_t {
  empty_pattern = 1,
  empty_field_reference = 2,
  invalid_field_path = 3,
  unbalanced_brace = 4,
  invalid_binary_literal = 5,
  missing_float_format = 10,
  missing_temporal_format = 11,
  invalid_width_spec = 12,
  value_type_mismatch = 13,
  unknown_field = 20,
  invalid_index_definition = 21,
  field_not_found = 30,
  incompatible_binary_value = 31,
  unsupported_attribute_value = 32,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"empty_pattern",
                                              error_code_t::empty_pattern},
    std::pair<std::string_view, error_code_t>{
        "empty_field_reference", error_code_t::empty_field_reference},
    std::pair<std::string_view, error_code_t>{
        "invalid_field_path", error_code_t::invalid_field_path},
    std::pair<std::string_view, error_code_t>{"unbalanced_brace",
                                              error_code_t::unbalanced_brace},
    std::pair<std::string_view, error_code_t>{
        "invalid_binary_literal", error_code_t::invalid_binary_literal},
    std::pair<std::string_view, error_code_t>{
        "missing_float_format", error_code_t::missing_float_format},
    std::pair<std::string_view, error_code_t>{
        "missing_temporal_format", error_code_t::missing_temporal_format},
    std::pair<std::string_view, error_code_t>{
        "invalid_width_spec", error_code_t::invalid_width_spec},
    std::pair<std::string_view, error_code_t>{
        "value_type_mismatch", error_code_t::value_type_mismatch},
    std::pair<std::string_view, error_code_t>{"unknown_field",
                                              error_code_t::unknown_field},
    std::pair<std::string_view, error_code_t>{
        "invalid_index_definition", error_code_t::invalid_index_definition},
    std::pair<std::string_view, error_code_t>{"field_not_found",
                                              error_code_t::field_not_found},
    std::pair<std::string_view, error_code_t>{
        "incompatible_binary_value", error_code_t::incompatible_binary_value},
    std::pair<std::string_view, error_code_t>{
        "unsupported_attribute_value",
        error_code_t::unsupported_attribute_value}};

inline constexpr std::string_view to_string(const error_code_t value) {
  return lexkey::common::to_string(value, kErrorCodeMappings)
      .value_or("unknown");
}

struct key_error_t final {
  error_code_t code{};
  std::string message;
  // Byte offset into the pattern, for parser errors.
  std::optional<std::size_t> offset;
};

template <typename T>
using result_t = std::variant<T, key_error_t>;

inline key_error_t make_error(const error_code_t code,
                              std::string message,
                              const std::optional<std::size_t> offset = {}) {
  return key_error_t{
      .code = code, .message = std::move(message), .offset = offset};
}

/// Prefix the message with the context it surfaced in, keeping the code.
inline key_error_t wrap_error(const std::string_view context,
                              key_error_t error) {
  error.message = std::string{context} + ": " + error.message;
  return error;
}

template <typename T>
bool is_ok(const result_t<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
const T& value_of(const result_t<T>& result) {
  return std::get<T>(result);
}

template <typename T>
T&& value_of(result_t<T>&& result) {
  return std::get<T>(std::move(result));
}

template <typename T>
const key_error_t& error_of(const result_t<T>& result) {
  return std::get<key_error_t>(result);
}

}  // namespace lexkey::schema

namespace lexkey::common {

template <>
inline std::optional<lexkey::schema::error_code_t>
try_from_string<lexkey::schema::error_code_t>(const std::string_view value) {
  return from_string(value, lexkey::schema::kErrorCodeMappings);
}

}  // namespace lexkey::common
