#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Pattern segments: the literal text and `{...}` field references a key
// pattern is made of.
namespace lexkey::pattern {

struct literal_segment_t final {
  std::string value;

  bool operator==(const literal_segment_t&) const = default;
};

/// One `{path:modifier...:%width}` reference.
///
/// `modifiers` keeps declaration order. The last modifier is the primary
/// encoding format; earlier ones are pre-transforms (only `utc` exists).
/// `width_spec` holds the trailing printf token, including its `%`.
struct field_ref_t final {
  std::string path;
  std::vector<std::string> modifiers;
  std::optional<std::string> width_spec;
  // Byte offset of the opening brace in the owning pattern.
  std::size_t offset{};

  /// Split dotted path, e.g. "user.id" -> {"user", "id"}.
  std::vector<std::string> path_components() const;

  /// Last path component; used to name generated parameters.
  std::string parameter_name() const;

  /// Last modifier; absent when there is none or it is empty ("{ts:}").
  std::optional<std::string_view> primary_format() const;

  bool has_modifier(std::string_view modifier) const;

  bool operator==(const field_ref_t&) const = default;
};

using segment_t = std::variant<literal_segment_t, field_ref_t>;

}  // namespace lexkey::pattern
