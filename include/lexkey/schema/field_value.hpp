#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

// Schema type: field value.
// Typed input handed to the key renderer: the value a caller holds for a
// parameter or an entity field before it is encoded.
namespace lexkey::schema {

/// An instant plus the UTC offset it was observed in.
struct timestamp_t final {
  int64_t unix_nanos{};
  int32_t offset_seconds{};

  bool operator==(const timestamp_t&) const = default;
};

using field_value_t =
    std::variant<std::string, int64_t, uint64_t, double, timestamp_t, bool>;

/// Keyed by parameter name (parameter side) or dotted field path (entity
/// side).
using field_values_t = std::map<std::string, field_value_t, std::less<>>;

}  // namespace lexkey::schema
