#pragma once

#include <lexkey/schema/attribute_kind.hpp>
#include <lexkey/schema/primitives.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: attribute value.
// Self-describing stored value, as a key-value backend hands records back.
// Numbers travel as their decimal string.
namespace lexkey::schema {

struct attribute_value_t;

using attribute_map_t = std::map<std::string, attribute_value_t, std::less<>>;
using attribute_list_t = std::vector<attribute_value_t>;

struct string_attribute_t final {
  std::string value;
};

struct number_attribute_t final {
  std::string value;
};

struct binary_attribute_t final {
  bytes_t value;
};

struct bool_attribute_t final {
  bool value{};
};

struct null_attribute_t final {};

struct map_attribute_t final {
  std::shared_ptr<const attribute_map_t> value;
};

struct list_attribute_t final {
  std::shared_ptr<const attribute_list_t> value;
};

struct attribute_value_t final {
  std::variant<string_attribute_t,
               number_attribute_t,
               binary_attribute_t,
               bool_attribute_t,
               null_attribute_t,
               map_attribute_t,
               list_attribute_t>
      value;
};

bool operator==(const attribute_value_t& lhs, const attribute_value_t& rhs);

attribute_value_t make_string_attribute(std::string value);
attribute_value_t make_number_attribute(std::string value);
attribute_value_t make_binary_attribute(bytes_t value);
attribute_value_t make_bool_attribute(bool value);
attribute_value_t make_null_attribute();
attribute_value_t make_map_attribute(attribute_map_t entries);
attribute_value_t make_list_attribute(attribute_list_t entries);

/// Key-compatible kind of a stored value; std::nullopt for bool, null, map
/// and list values.
std::optional<attribute_kind_t> key_kind_of(const attribute_value_t& value);

/// Map entries of a value, or nullptr when it is not a map.
const attribute_map_t* as_map(const attribute_value_t& value);

/// Short type tag for messages ("S", "N", "B", "BOOL", "NULL", "M", "L").
std::string_view type_tag(const attribute_value_t& value);

}  // namespace lexkey::schema
