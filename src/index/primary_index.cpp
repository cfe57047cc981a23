#include <lexkey/index/primary_index.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

using lexkey::schema::error_code_t;
using lexkey::schema::make_error;

namespace lexkey::index {

std::optional<schema::key_error_t> secondary_index_t::validate() const {
  if (gsi.name.empty()) {
    return make_error(error_code_t::invalid_index_definition,
                      "secondary index GSI name is required");
  }
  if (gsi.keys.partition_key.name.empty()) {
    return make_error(
        error_code_t::invalid_index_definition,
        fmt::format("partition key name is required for GSI \"{}\"", gsi.name));
  }
  if (!partition.has_value_source()) {
    return make_error(
        error_code_t::invalid_index_definition,
        fmt::format("partition key value source (format, field or constant) "
                    "is required for GSI \"{}\"",
                    gsi.name));
  }
  if (sort && sort->has_value_source() && !gsi.keys.sort_key) {
    return make_error(
        error_code_t::invalid_index_definition,
        fmt::format("GSI \"{}\" has a sort key value but no sort key "
                    "definition",
                    gsi.name));
  }
  return std::nullopt;
}

std::optional<schema::key_error_t> primary_index_t::validate() const {
  if (table.name.empty()) {
    return make_error(error_code_t::invalid_index_definition,
                      "table name is required");
  }
  if (!partition_key.has_value_source()) {
    return make_error(error_code_t::invalid_index_definition,
                      "partition key format is required");
  }
  if (sort_key && sort_key->has_value_source() && !table.keys.sort_key) {
    return make_error(
        error_code_t::invalid_index_definition,
        fmt::format("table \"{}\" has a sort key value but no sort key "
                    "definition",
                    table.name));
  }
  for (const auto& gsi : secondary) {
    if (auto error = gsi.validate()) {
      return schema::wrap_error(fmt::format("GSI \"{}\"", gsi.name()),
                                std::move(*error));
    }
  }
  return std::nullopt;
}

const secondary_index_t* primary_index_t::find_secondary(
    const std::string_view name) const {
  auto found = std::ranges::find_if(
      secondary, [&](const auto& gsi) { return gsi.name() == name; });
  if (found == std::end(secondary)) {
    return nullptr;
  }
  return &*found;
}

}  // namespace lexkey::index
