#pragma once

#include <lexkey/common/enum_string.hpp>
#include <lexkey/index/compiler.hpp>
#include <lexkey/schema/attribute_value.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/field_value.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace lexkey::index {

/// Which descriptor of each part to evaluate, and so how `values` is keyed.
enum class render_side_t : uint8_t {
  // By parameter name, e.g. "id".
  parameter = 0,
  // By dotted field path, e.g. "user.id".
  entity = 1
};

inline constexpr auto kRenderSideMappings = std::array{
    std::pair<std::string_view, render_side_t>{"parameter",
                                               render_side_t::parameter},
    std::pair<std::string_view, render_side_t>{"entity",
                                               render_side_t::entity}};

inline constexpr std::string_view to_string(const render_side_t value) {
  return lexkey::common::to_string(value, kRenderSideMappings)
      .value_or("unknown");
}

/// Build a key attribute from typed values. A missing value is
/// `field_not_found`.
schema::result_t<schema::attribute_value_t> render(
    const compiled_key_t& key,
    const schema::field_values_t& values,
    render_side_t side = render_side_t::parameter);

/// Key text only, before it is wrapped in the key's kind.
schema::result_t<std::string> render_text(
    const compiled_key_t& key,
    const schema::field_values_t& values,
    render_side_t side = render_side_t::parameter);

/// Range-query prefix: the key's literal prefix followed by `suffix`.
std::string begins_with(const compiled_key_t& key, std::string_view suffix = {});

}  // namespace lexkey::index
