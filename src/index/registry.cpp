#include <lexkey/index/registry.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace lexkey::index {

std::optional<schema::key_error_t> index_registry::add(std::string entity_label,
                                                       primary_index_t index) {
  if (auto error = index.validate()) {
    return schema::wrap_error(entity_label, std::move(*error));
  }
  auto extractor = key_extractor{index};
  auto entry = std::make_shared<const registered_index_t>(registered_index_t{
      .entity_label = entity_label,
      .index = std::move(index),
      .extractor = std::move(extractor)});

  auto lock = std::unique_lock{mutex_};
  auto inserted = entries_.insert_or_assign(entity_label, entry).second;
  if (inserted) {
    order_.push_back(entity_label);
    spdlog::info("registered index for {} on table \"{}\"", entity_label,
                 entry->index.table.name);
  } else {
    spdlog::debug("replaced index for {} on table \"{}\"", entity_label,
                  entry->index.table.name);
  }
  return std::nullopt;
}

index_registry::entry_t index_registry::find(
    const std::string_view entity_label) const {
  auto lock = std::shared_lock{mutex_};
  auto found = entries_.find(entity_label);
  if (found == std::end(entries_)) {
    return nullptr;
  }
  return found->second;
}

std::vector<index_registry::entry_t> index_registry::all() const {
  auto lock = std::shared_lock{mutex_};
  auto result = std::vector<entry_t>{};
  result.reserve(order_.size());
  for (const auto& label : order_) {
    result.push_back(entries_.find(label)->second);
  }
  return result;
}

std::size_t index_registry::size() const {
  auto lock = std::shared_lock{mutex_};
  return entries_.size();
}

void index_registry::clear() {
  auto lock = std::unique_lock{mutex_};
  entries_.clear();
  order_.clear();
}

}  // namespace lexkey::index
