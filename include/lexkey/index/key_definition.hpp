#pragma once

#include <lexkey/schema/attribute_kind.hpp>

#include <optional>
#include <string>
#include <vector>

// Table shape: key attribute names and kinds for the base table and its
// global secondary indexes.
namespace lexkey::index {

struct key_def_t final {
  std::string name;
  schema::attribute_kind_t kind{schema::attribute_kind_t::string};
};

struct primary_key_definition_t final {
  key_def_t partition_key;
  std::optional<key_def_t> sort_key;
};

struct gsi_definition_t final {
  std::string name;
  primary_key_definition_t keys;
};

struct table_definition_t final {
  std::string name;
  primary_key_definition_t keys;
  // Empty when the table has no TTL attribute.
  std::string time_to_live_key;
  std::vector<gsi_definition_t> gsis;
};

}  // namespace lexkey::index
