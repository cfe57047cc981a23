#include <lexkey/common/critical.hpp>
#include <lexkey/index/key_extractor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using lexkey::schema::attribute_map_t;
using lexkey::schema::error_code_t;

namespace lexkey::index {

namespace {

std::optional<key_def_t> sort_key_of(const primary_key_definition_t& keys,
                                     const std::optional<val_def_t>& value) {
  if (!keys.sort_key || !value || !value->has_value_source()) {
    return std::nullopt;
  }
  return keys.sort_key;
}

}  // namespace

key_extractor::key_extractor(const primary_index_t& index)
    : table_name_(index.table.name) {
  if (auto error = index.validate()) {
    lexkey::common::critical("invalid index for table \"{}\": {}",
                             index.table.name, error->message);
  }

  primary_.name = index.table.name;
  primary_.partition = key_plan_t{.key = index.table.keys.partition_key,
                                  .node = index.partition_key.extraction()};
  if (auto sort = sort_key_of(index.table.keys, index.sort_key)) {
    primary_.sort = key_plan_t{.key = *sort, .node = index.sort_key->extraction()};
  }

  secondary_.reserve(index.secondary.size());
  for (const auto& gsi : index.secondary) {
    auto plan = index_plan_t{};
    plan.name = gsi.name();
    plan.partition = key_plan_t{.key = gsi.gsi.keys.partition_key,
                                .node = gsi.partition.extraction()};
    if (auto sort = sort_key_of(gsi.gsi.keys, gsi.sort)) {
      plan.sort = key_plan_t{.key = *sort, .node = gsi.sort->extraction()};
    }
    secondary_.push_back(std::move(plan));
  }
}

schema::result_t<attribute_map_t> key_extractor::extract(
    const index_plan_t& plan,
    const attribute_map_t& record) {
  auto keys = attribute_map_t{};
  auto partition =
      extraction::apply(plan.partition.node, record, plan.partition.key.kind);
  if (!schema::is_ok(partition)) {
    return schema::wrap_error("partition key", schema::error_of(partition));
  }
  keys.emplace(plan.partition.key.name,
               schema::value_of(std::move(partition)));

  if (plan.sort) {
    auto sort = extraction::apply(plan.sort->node, record, plan.sort->key.kind);
    if (!schema::is_ok(sort)) {
      return schema::wrap_error("sort key", schema::error_of(sort));
    }
    keys.emplace(plan.sort->key.name, schema::value_of(std::move(sort)));
  }
  return keys;
}

schema::result_t<attribute_map_t> key_extractor::primary_key(
    const attribute_map_t& record) const {
  return extract(primary_, record);
}

schema::result_t<std::optional<attribute_map_t>> key_extractor::secondary_keys(
    const std::string_view gsi_name,
    const attribute_map_t& record) const {
  auto plan = std::ranges::find_if(
      secondary_, [&](const auto& candidate) { return candidate.name == gsi_name; });
  if (plan == std::end(secondary_)) {
    return schema::make_error(
        error_code_t::invalid_index_definition,
        fmt::format("table \"{}\" has no secondary index \"{}\"", table_name_,
                    gsi_name));
  }

  auto keys = extract(*plan, record);
  if (schema::is_ok(keys)) {
    return std::optional<attribute_map_t>{schema::value_of(std::move(keys))};
  }
  const auto& error = schema::error_of(keys);
  if (error.code != error_code_t::field_not_found) {
    return error;
  }
  spdlog::debug("record left out of GSI \"{}\" on table \"{}\": {}", gsi_name,
                table_name_, error.message);
  return std::optional<attribute_map_t>{};
}

schema::result_t<attribute_map_t> key_extractor::all_secondary_keys(
    const attribute_map_t& record) const {
  auto merged = attribute_map_t{};
  for (const auto& plan : secondary_) {
    auto keys = secondary_keys(plan.name, record);
    if (!schema::is_ok(keys)) {
      return schema::wrap_error(fmt::format("GSI \"{}\"", plan.name),
                                schema::error_of(keys));
    }
    const auto& found = schema::value_of(keys);
    if (found) {
      merged.insert(std::begin(*found), std::end(*found));
    }
  }
  return merged;
}

}  // namespace lexkey::index
