#include <lexkey/pattern/pattern_spec.hpp>

#include <utility>

namespace lexkey::pattern {

pattern_spec::pattern_spec(std::string raw,
                           schema::attribute_kind_t kind,
                           std::vector<segment_t> segments)
    : raw_(std::move(raw)), kind_(kind), segments_(std::move(segments)) {}

bool pattern_spec::is_constant() const {
  return segments_.size() == 1 &&
         std::holds_alternative<literal_segment_t>(segments_.front());
}

std::string pattern_spec::literal_prefix() const {
  if (segments_.empty()) {
    return {};
  }
  const auto* literal = std::get_if<literal_segment_t>(&segments_.front());
  if (literal == nullptr) {
    return {};
  }
  return literal->value;
}

std::vector<field_ref_t> pattern_spec::field_refs() const {
  auto refs = std::vector<field_ref_t>{};
  for (const auto& segment : segments_) {
    if (const auto* ref = std::get_if<field_ref_t>(&segment)) {
      refs.push_back(*ref);
    }
  }
  return refs;
}

std::vector<std::string> pattern_spec::field_paths() const {
  auto paths = std::vector<std::string>{};
  for (const auto& segment : segments_) {
    if (const auto* ref = std::get_if<field_ref_t>(&segment)) {
      paths.push_back(ref->path);
    }
  }
  return paths;
}

}  // namespace lexkey::pattern
