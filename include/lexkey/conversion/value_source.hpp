#pragma once

#include <string>
#include <variant>

// Where a converted value is read from: a free-standing named input
// (query parameter side) or an access path on an entity (storage side).
namespace lexkey::conversion {

struct named_input_t final {
  std::string name;

  bool operator==(const named_input_t&) const = default;
};

struct field_access_t final {
  // Dotted path, e.g. "user.id".
  std::string path;

  bool operator==(const field_access_t&) const = default;
};

using value_source_t = std::variant<named_input_t, field_access_t>;

}  // namespace lexkey::conversion
