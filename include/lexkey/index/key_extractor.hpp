#pragma once

#include <lexkey/extraction/node.hpp>
#include <lexkey/index/primary_index.hpp>
#include <lexkey/schema/attribute_value.hpp>
#include <lexkey/schema/error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexkey::index {

/// Recomputes key attributes from stored records.
///
/// Derivation trees are built once, at construction; extraction is
/// read-only and may run concurrently on one instance. Secondary indexes
/// are sparse: a record missing a field the index needs simply has no key
/// in that index.
class key_extractor final {
 public:
  /// `index` must be valid (see primary_index_t::validate); an invalid
  /// definition terminates the process.
  explicit key_extractor(const primary_index_t& index);

  /// {partition key name: value[, sort key name: value]}. Missing fields
  /// are errors.
  schema::result_t<schema::attribute_map_t> primary_key(
      const schema::attribute_map_t& record) const;

  /// std::nullopt when the record does not take part in the index.
  /// Unknown index names are `invalid_index_definition`.
  schema::result_t<std::optional<schema::attribute_map_t>> secondary_keys(
      std::string_view gsi_name,
      const schema::attribute_map_t& record) const;

  /// Key attributes of every secondary index the record takes part in,
  /// merged into one map.
  schema::result_t<schema::attribute_map_t> all_secondary_keys(
      const schema::attribute_map_t& record) const;

  const std::string& table_name() const { return table_name_; }

 private:
  struct key_plan_t final {
    key_def_t key;
    extraction::extraction_node_t node;
  };

  struct index_plan_t final {
    std::string name;
    key_plan_t partition;
    std::optional<key_plan_t> sort;
  };

  static schema::result_t<schema::attribute_map_t> extract(
      const index_plan_t& plan,
      const schema::attribute_map_t& record);

  std::string table_name_;
  index_plan_t primary_;
  std::vector<index_plan_t> secondary_;
};

}  // namespace lexkey::index
