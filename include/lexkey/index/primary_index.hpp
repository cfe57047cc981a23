#pragma once

#include <lexkey/index/key_definition.hpp>
#include <lexkey/index/val_def.hpp>
#include <lexkey/schema/error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexkey::index {

/// Key values for one global secondary index.
///
///   secondary_index_t{.gsi = table.gsis[0],
///                     .partition = fmt("EMAIL#{email}"),
///                     .sort = fmt("USER#{id}")}
struct secondary_index_t final {
  gsi_definition_t gsi;
  val_def_t partition;
  std::optional<val_def_t> sort;

  const std::string& name() const { return gsi.name; }

  std::optional<schema::key_error_t> validate() const;
};

/// Base table keys of one entity plus the secondary indexes it takes part
/// in.
///
///   primary_index_t{.table = users_table,
///                   .partition_key = fmt("USER#{id}"),
///                   .sort_key = string_constant("PROFILE")}
struct primary_index_t final {
  table_definition_t table;
  val_def_t partition_key;
  std::optional<val_def_t> sort_key;
  std::vector<secondary_index_t> secondary;

  /// First problem found, as `invalid_index_definition`.
  std::optional<schema::key_error_t> validate() const;

  const secondary_index_t* find_secondary(std::string_view name) const;
};

}  // namespace lexkey::index
