#pragma once

#include <lexkey/common/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: attribute kind.
// Encoded type of a key attribute: string (S), number (N) or binary (B).
namespace lexkey::schema {

enum class attribute_kind_t : uint8_t { string = 0, number = 1, binary = 2 };

inline constexpr auto kAttributeKindMappings = std::array{
    std::pair<std::string_view, attribute_kind_t>{"S", attribute_kind_t::string},
    std::pair<std::string_view, attribute_kind_t>{"N", attribute_kind_t::number},
    std::pair<std::string_view, attribute_kind_t>{"B",
                                                  attribute_kind_t::binary}};

inline constexpr std::string_view to_string(const attribute_kind_t value) {
  return lexkey::common::to_string(value, kAttributeKindMappings)
      .value_or("unknown");
}

}  // namespace lexkey::schema

namespace lexkey::common {

template <>
inline std::optional<lexkey::schema::attribute_kind_t>
try_from_string<lexkey::schema::attribute_kind_t>(
    const std::string_view value) {
  return from_string(value, lexkey::schema::kAttributeKindMappings);
}

}  // namespace lexkey::common
