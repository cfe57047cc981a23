#pragma once

#include <lexkey/extraction/node.hpp>
#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/attribute_value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

// How a key attribute gets its value: a format pattern, a copy of one field,
// or a constant.
namespace lexkey::index {

struct format_source_t final {
  pattern::pattern_spec spec;
};

struct field_source_t final {
  // Dotted path, e.g. "user.id".
  std::string path;
};

struct constant_source_t final {
  schema::attribute_value_t value;
};

struct val_def_t final {
  // std::monostate until one of the helpers below sets a source.
  std::variant<std::monostate, format_source_t, field_source_t,
               constant_source_t>
      source;

  bool has_value_source() const {
    return !std::holds_alternative<std::monostate>(source);
  }

  /// Derivation tree for this value. Requires a value source.
  extraction::extraction_node_t extraction() const;
};

// Format helpers parse eagerly; an invalid pattern in a static definition
// terminates the process.
val_def_t fmt(std::string_view raw);
val_def_t num_fmt(std::string_view raw);
val_def_t bytes_fmt(std::string_view raw);

val_def_t from_field(std::string_view path);

val_def_t string_constant(std::string_view value);
val_def_t number_constant(int64_t value);
val_def_t number_constant(double value);
/// `encoded` is base64; invalid input terminates the process.
val_def_t bytes_constant(std::string_view encoded);

}  // namespace lexkey::index
