#pragma once

#include <lexkey/index/key_extractor.hpp>
#include <lexkey/index/primary_index.hpp>
#include <lexkey/schema/error.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lexkey::index {

struct registered_index_t final {
  std::string entity_label;
  primary_index_t index;
  key_extractor extractor;
};

/// Index definitions by entity label.
///
/// Thread safety: every member may be called concurrently. Lookups take a
/// shared lock; `add` and `clear` take it exclusively. Returned entries are
/// immutable and stay valid after they are replaced or cleared.
class index_registry final {
 public:
  using entry_t = std::shared_ptr<const registered_index_t>;

  /// Validates `index` and stores it under `entity_label`. Re-adding a label
  /// replaces the entry but keeps its original position in `all()`.
  std::optional<schema::key_error_t> add(std::string entity_label,
                                         primary_index_t index);

  /// nullptr when nothing is registered under `entity_label`.
  entry_t find(std::string_view entity_label) const;

  /// Every entry, in first registration order.
  std::vector<entry_t> all() const;

  std::size_t size() const;

  void clear();

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, entry_t, std::less<>> entries_;
  std::vector<std::string> order_;
};

}  // namespace lexkey::index
