#include <lexkey/schema/attribute_value.hpp>

#include <utility>

namespace lexkey::schema {

namespace {

template <typename Container>
bool shared_equal(const std::shared_ptr<const Container>& lhs,
                  const std::shared_ptr<const Container>& rhs) {
  if (lhs == rhs) {
    return true;
  }
  if (!lhs || !rhs) {
    return false;
  }
  return *lhs == *rhs;
}

}  // namespace

bool operator==(const attribute_value_t& lhs, const attribute_value_t& rhs) {
  if (lhs.value.index() != rhs.value.index()) {
    return false;
  }
  return std::visit(
      overloaded{
          [&](const string_attribute_t& arg) {
            return arg.value == std::get<string_attribute_t>(rhs.value).value;
          },
          [&](const number_attribute_t& arg) {
            return arg.value == std::get<number_attribute_t>(rhs.value).value;
          },
          [&](const binary_attribute_t& arg) {
            return arg.value == std::get<binary_attribute_t>(rhs.value).value;
          },
          [&](const bool_attribute_t& arg) {
            return arg.value == std::get<bool_attribute_t>(rhs.value).value;
          },
          [](const null_attribute_t&) { return true; },
          [&](const map_attribute_t& arg) {
            return shared_equal(arg.value,
                                std::get<map_attribute_t>(rhs.value).value);
          },
          [&](const list_attribute_t& arg) {
            return shared_equal(arg.value,
                                std::get<list_attribute_t>(rhs.value).value);
          }},
      lhs.value);
}

attribute_value_t make_string_attribute(std::string value) {
  return attribute_value_t{string_attribute_t{std::move(value)}};
}

attribute_value_t make_number_attribute(std::string value) {
  return attribute_value_t{number_attribute_t{std::move(value)}};
}

attribute_value_t make_binary_attribute(bytes_t value) {
  return attribute_value_t{binary_attribute_t{std::move(value)}};
}

attribute_value_t make_bool_attribute(const bool value) {
  return attribute_value_t{bool_attribute_t{value}};
}

attribute_value_t make_null_attribute() {
  return attribute_value_t{null_attribute_t{}};
}

attribute_value_t make_map_attribute(attribute_map_t entries) {
  return attribute_value_t{map_attribute_t{
      std::make_shared<const attribute_map_t>(std::move(entries))}};
}

attribute_value_t make_list_attribute(attribute_list_t entries) {
  return attribute_value_t{list_attribute_t{
      std::make_shared<const attribute_list_t>(std::move(entries))}};
}

std::optional<attribute_kind_t> key_kind_of(const attribute_value_t& value) {
  return std::visit(
      overloaded{[](const string_attribute_t&)
                     -> std::optional<attribute_kind_t> {
                   return attribute_kind_t::string;
                 },
                 [](const number_attribute_t&)
                     -> std::optional<attribute_kind_t> {
                   return attribute_kind_t::number;
                 },
                 [](const binary_attribute_t&)
                     -> std::optional<attribute_kind_t> {
                   return attribute_kind_t::binary;
                 },
                 [](const auto&) -> std::optional<attribute_kind_t> {
                   return std::nullopt;
                 }},
      value.value);
}

const attribute_map_t* as_map(const attribute_value_t& value) {
  const auto* map = std::get_if<map_attribute_t>(&value.value);
  if (map == nullptr || !map->value) {
    return nullptr;
  }
  return map->value.get();
}

std::string_view type_tag(const attribute_value_t& value) {
  return std::visit(
      overloaded{[](const string_attribute_t&) { return std::string_view{"S"}; },
                 [](const number_attribute_t&) { return std::string_view{"N"}; },
                 [](const binary_attribute_t&) { return std::string_view{"B"}; },
                 [](const bool_attribute_t&) {
                   return std::string_view{"BOOL"};
                 },
                 [](const null_attribute_t&) {
                   return std::string_view{"NULL"};
                 },
                 [](const map_attribute_t&) { return std::string_view{"M"}; },
                 [](const list_attribute_t&) { return std::string_view{"L"}; }},
      value.value);
}

}  // namespace lexkey::schema
