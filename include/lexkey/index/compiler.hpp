#pragma once

#include <lexkey/conversion/descriptor.hpp>
#include <lexkey/index/primary_index.hpp>
#include <lexkey/pattern/segment.hpp>
#include <lexkey/schema/attribute_kind.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/primitives.hpp>
#include <lexkey/schema/semantic_type.hpp>
#include <lexkey/sortability/advisor.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Index assembly: resolves every key value of an index against the field
// types of its entity and produces the descriptor tree an emitter (or the
// renderer) consumes.
namespace lexkey::index {

struct index_binding_t final {
  std::string entity_label;
  primary_index_t index;
  schema::field_type_table_t field_types;
};

/// Input a caller supplies when building the key from loose values.
struct parameter_t final {
  std::string name;
  std::string field_path;
  std::string type_name;
  schema::semantic_type_t type{schema::semantic_type_t::other};

  bool operator==(const parameter_t&) const = default;
};

struct literal_part_t final {
  std::string value;

  bool operator==(const literal_part_t&) const = default;
};

/// A field reference converted twice: once reading a named input, once
/// reading the entity field.
struct parameter_part_t final {
  pattern::field_ref_t ref;
  conversion::conversion_descriptor_t parameter_side;
  conversion::conversion_descriptor_t entity_side;

  bool operator==(const parameter_part_t&) const = default;
};

using compiled_part_t = std::variant<literal_part_t, parameter_part_t>;

struct compiled_key_t final {
  std::string key_name;
  schema::attribute_kind_t kind{schema::attribute_kind_t::string};
  std::vector<compiled_part_t> parts;
  // Deduplicated by field path, in first-use order.
  std::vector<parameter_t> parameters;
  std::string literal_prefix;
  bool is_constant{false};
  bool requires_numeric_library{false};
  bool requires_temporal_library{false};
};

struct compiled_gsi_t final {
  std::string name;
  compiled_key_t partition;
  std::optional<compiled_key_t> sort;
};

struct compiled_index_t final {
  std::string entity_label;
  std::string table_name;
  compiled_key_t partition;
  std::optional<compiled_key_t> sort;
  std::vector<compiled_gsi_t> gsis;
  // Sort-key advice from the table and every GSI.
  std::vector<sortability::diagnostic_t> diagnostics;

  bool requires_numeric_library() const;
  bool requires_temporal_library() const;
};

/// Compile one key value. `sort_position` enables sortability checks, which
/// are appended to `diagnostics`.
schema::result_t<compiled_key_t> compile_key(
    const key_def_t& key,
    const val_def_t& value,
    const schema::field_type_table_t& field_types,
    std::string_view entity_label,
    bool sort_position,
    std::vector<sortability::diagnostic_t>& diagnostics);

/// Validates the index, then compiles the table keys and every GSI.
/// Errors are prefixed with "partition key", "sort key" or "GSI <name>".
schema::result_t<compiled_index_t> compile(const index_binding_t& binding);

}  // namespace lexkey::index
