#include <lexkey/pattern/segment.hpp>
#include <lexkey/schema/primitives.hpp>

#include <algorithm>

namespace lexkey::pattern {

std::vector<std::string> field_ref_t::path_components() const {
  return lexkey::schema::split(path, '.');
}

std::string field_ref_t::parameter_name() const {
  auto separator = path.rfind('.');
  if (separator == std::string::npos) {
    return path;
  }
  return path.substr(separator + 1);
}

std::optional<std::string_view> field_ref_t::primary_format() const {
  if (modifiers.empty() || modifiers.back().empty()) {
    return std::nullopt;
  }
  return std::string_view{modifiers.back()};
}

bool field_ref_t::has_modifier(const std::string_view modifier) const {
  return std::ranges::find(modifiers, modifier) != std::end(modifiers);
}

}  // namespace lexkey::pattern
