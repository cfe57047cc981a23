#pragma once

#include <lexkey/common/enum_string.hpp>
#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/primitives.hpp>
#include <lexkey/schema/semantic_type.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Sort-key advice: flags field references whose encoded text would not
// sort in the same order as the values they encode. Advisory only.
namespace lexkey::sortability {

enum class unsafe_condition_t : uint8_t {
  unpadded_integer = 0,
  unpadded_float = 1,
  unpadded_epoch_counter = 2,
  variable_width_timestamp = 3,
  timezone_dependent_timestamp = 4
};

inline constexpr auto kUnsafeConditionMappings = std::array{
    std::pair<std::string_view, unsafe_condition_t>{
        "unpadded_integer", unsafe_condition_t::unpadded_integer},
    std::pair<std::string_view, unsafe_condition_t>{
        "unpadded_float", unsafe_condition_t::unpadded_float},
    std::pair<std::string_view, unsafe_condition_t>{
        "unpadded_epoch_counter", unsafe_condition_t::unpadded_epoch_counter},
    std::pair<std::string_view, unsafe_condition_t>{
        "variable_width_timestamp",
        unsafe_condition_t::variable_width_timestamp},
    std::pair<std::string_view, unsafe_condition_t>{
        "timezone_dependent_timestamp",
        unsafe_condition_t::timezone_dependent_timestamp}};

inline constexpr std::string_view to_string(const unsafe_condition_t value) {
  return lexkey::common::to_string(value, kUnsafeConditionMappings)
      .value_or("unknown");
}

struct diagnostic_t final {
  std::string entity_label;
  std::string field_path;
  unsafe_condition_t condition{};
  std::string cause;
  std::string suggestion;

  /// "<entity> sort key field <path>: <cause>; <suggestion>"
  std::string message() const;

  bool operator==(const diagnostic_t&) const = default;
};

std::optional<diagnostic_t> check_sort_safety(
    const pattern::field_ref_t& ref,
    schema::semantic_type_t type,
    std::string_view entity_label);

/// One independent check per field reference, in pattern order. Paths
/// missing from `field_types` are checked as `other` and never flagged.
std::vector<diagnostic_t> check_sort_safety(
    const pattern::pattern_spec& spec,
    const schema::field_type_table_t& field_types,
    std::string_view entity_label);

}  // namespace lexkey::sortability
