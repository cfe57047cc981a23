#pragma once

#include <lexkey/common/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: semantic type.
// Coarse classification of a field's declared type; the conversion engine
// and the sortability advisor dispatch on it.
namespace lexkey::schema {

enum class semantic_type_t : uint8_t {
  text = 0,
  signed_integer = 1,
  unsigned_integer = 2,
  floating_point = 3,
  temporal = 4,
  other = 5
};

inline constexpr auto kSemanticTypeMappings = std::array{
    std::pair<std::string_view, semantic_type_t>{"text", semantic_type_t::text},
    std::pair<std::string_view, semantic_type_t>{
        "signed_integer", semantic_type_t::signed_integer},
    std::pair<std::string_view, semantic_type_t>{
        "unsigned_integer", semantic_type_t::unsigned_integer},
    std::pair<std::string_view, semantic_type_t>{
        "floating_point", semantic_type_t::floating_point},
    std::pair<std::string_view, semantic_type_t>{"temporal",
                                                 semantic_type_t::temporal},
    std::pair<std::string_view, semantic_type_t>{"other",
                                                 semantic_type_t::other}};

inline constexpr std::string_view to_string(const semantic_type_t value) {
  return lexkey::common::to_string(value, kSemanticTypeMappings)
      .value_or("other");
}

/// Classify a type name reported by a schema provider. Unknown names map to
/// `other`.
semantic_type_t classify(std::string_view type_name);

inline constexpr bool is_integer(const semantic_type_t type) {
  return type == semantic_type_t::signed_integer ||
         type == semantic_type_t::unsigned_integer;
}

}  // namespace lexkey::schema
