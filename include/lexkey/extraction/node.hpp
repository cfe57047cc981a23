#pragma once

#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/attribute_kind.hpp>
#include <lexkey/schema/attribute_value.hpp>
#include <lexkey/schema/error.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Derivation tree: recomputes a key attribute from a stored record.
// Built once per key definition; applying it never mutates it.
namespace lexkey::extraction {

struct extraction_node_t;

struct literal_t final {
  schema::attribute_value_t value;
};

struct field_path_t final {
  std::vector<std::string> components;
};

struct concat_t final {
  std::vector<extraction_node_t> children;
};

struct extraction_node_t final {
  std::variant<literal_t, field_path_t, concat_t> node;
};

/// Constant specs become a literal (decoded bytes for binary keys), a lone
/// field reference a field path, anything else a concatenation.
extraction_node_t build(const pattern::pattern_spec& spec);

/// Copy of a (possibly dotted) field, e.g. "user.id".
extraction_node_t build_field(std::string_view path);

extraction_node_t build_constant(schema::attribute_value_t value);

/// Stored values are used verbatim; format modifiers only apply when a key
/// is written from typed values.
schema::result_t<schema::attribute_value_t> apply(
    const extraction_node_t& node,
    const schema::attribute_map_t& record,
    schema::attribute_kind_t kind);

}  // namespace lexkey::extraction
