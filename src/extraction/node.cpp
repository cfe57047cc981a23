#include <lexkey/extraction/node.hpp>
#include <lexkey/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

using lexkey::schema::attribute_kind_t;
using lexkey::schema::attribute_map_t;
using lexkey::schema::attribute_value_t;
using lexkey::schema::error_code_t;
using lexkey::schema::make_error;

namespace lexkey::extraction {

namespace {

using value_result_t = schema::result_t<attribute_value_t>;
using text_result_t = schema::result_t<std::string>;

value_result_t lookup(const field_path_t& path,
                      const attribute_map_t& record) {
  const auto* current = &record;
  for (auto index = std::size_t{0}; index < path.components.size(); ++index) {
    const auto& component = path.components[index];
    auto found = current->find(component);
    if (found == std::end(*current)) {
      return make_error(
          error_code_t::field_not_found,
          fmt::format("field {} not found",
                      schema::join(path.components, ".")));
    }
    if (index + 1 == path.components.size()) {
      return found->second;
    }
    current = schema::as_map(found->second);
    if (current == nullptr) {
      return make_error(
          error_code_t::field_not_found,
          fmt::format("field {} not found: {} is {}, not a map",
                      schema::join(path.components, "."), component,
                      schema::type_tag(found->second)));
    }
  }
  return make_error(error_code_t::field_not_found, "empty field path");
}

// Leaf coercion to the key's declared kind.
value_result_t coerce(const attribute_value_t& value,
                      const attribute_kind_t kind) {
  auto leaf_kind = schema::key_kind_of(value);
  if (!leaf_kind) {
    return make_error(error_code_t::unsupported_attribute_value,
                      fmt::format("{} values cannot be used in keys",
                                  schema::type_tag(value)));
  }
  switch (kind) {
    case attribute_kind_t::string:
      return std::visit(
          overloaded{
              [](const schema::string_attribute_t& text) {
                return schema::make_string_attribute(text.value);
              },
              [](const schema::number_attribute_t& number) {
                return schema::make_string_attribute(number.value);
              },
              [](const schema::binary_attribute_t& bytes) {
                return schema::make_string_attribute(
                    schema::make_string(schema::make_bytes_view(bytes.value)));
              },
              [&](const auto&) { return value; }},
          value.value);
    case attribute_kind_t::number:
      return std::visit(
          overloaded{
              [](const schema::string_attribute_t& text) {
                return schema::make_number_attribute(text.value);
              },
              [](const schema::binary_attribute_t& bytes) {
                return schema::make_number_attribute(
                    schema::make_string(schema::make_bytes_view(bytes.value)));
              },
              [&](const auto&) { return value; }},
          value.value);
    case attribute_kind_t::binary:
      break;
  }
  if (const auto* text = std::get_if<schema::string_attribute_t>(&value.value)) {
    return schema::make_binary_attribute(
        schema::make_bytes(std::string_view{text->value}));
  }
  if (std::holds_alternative<schema::binary_attribute_t>(value.value)) {
    return value;
  }
  return make_error(error_code_t::incompatible_binary_value,
                    fmt::format("{} value cannot be stored in a binary key",
                                schema::type_tag(value)));
}

// String form of a node, for concatenation.
text_result_t apply_text(const extraction_node_t& node,
                         const attribute_map_t& record);

text_result_t text_of(const attribute_value_t& value) {
  auto coerced = coerce(value, attribute_kind_t::string);
  if (!schema::is_ok(coerced)) {
    return schema::error_of(coerced);
  }
  return std::get<schema::string_attribute_t>(schema::value_of(coerced).value)
      .value;
}

text_result_t apply_text(const extraction_node_t& node,
                         const attribute_map_t& record) {
  return std::visit(
      overloaded{
          [&](const literal_t& literal) { return text_of(literal.value); },
          [&](const field_path_t& path) -> text_result_t {
            auto found = lookup(path, record);
            if (!schema::is_ok(found)) {
              return schema::error_of(found);
            }
            return text_of(schema::value_of(found));
          },
          [&](const concat_t& concat) -> text_result_t {
            auto out = std::string{};
            for (const auto& child : concat.children) {
              auto part = apply_text(child, record);
              if (!schema::is_ok(part)) {
                return part;
              }
              out += schema::value_of(part);
            }
            return out;
          }},
      node.node);
}

}  // namespace

extraction_node_t build(const pattern::pattern_spec& spec) {
  if (spec.is_constant()) {
    if (spec.kind() == attribute_kind_t::binary) {
      return build_constant(
          schema::make_binary_attribute(schema::from_base64(spec.raw())));
    }
    if (spec.kind() == attribute_kind_t::number) {
      return build_constant(schema::make_number_attribute(spec.raw()));
    }
    return build_constant(schema::make_string_attribute(spec.raw()));
  }

  const auto& segments = spec.segments();
  if (segments.size() == 1) {
    return build_field(std::get<pattern::field_ref_t>(segments.front()).path);
  }

  auto concat = concat_t{};
  concat.children.reserve(segments.size());
  for (const auto& segment : segments) {
    std::visit(overloaded{[&](const pattern::literal_segment_t& literal) {
                            concat.children.push_back(build_constant(
                                schema::make_string_attribute(literal.value)));
                          },
                          [&](const pattern::field_ref_t& ref) {
                            concat.children.push_back(build_field(ref.path));
                          }},
               segment);
  }
  return extraction_node_t{.node = std::move(concat)};
}

extraction_node_t build_field(const std::string_view path) {
  return extraction_node_t{.node = field_path_t{schema::split(path, '.')}};
}

extraction_node_t build_constant(attribute_value_t value) {
  return extraction_node_t{.node = literal_t{std::move(value)}};
}

value_result_t apply(const extraction_node_t& node,
                     const attribute_map_t& record,
                     const attribute_kind_t kind) {
  return std::visit(
      overloaded{
          [&](const literal_t& literal) { return coerce(literal.value, kind); },
          [&](const field_path_t& path) -> value_result_t {
            auto found = lookup(path, record);
            if (!schema::is_ok(found)) {
              return found;
            }
            return coerce(schema::value_of(found), kind);
          },
          [&](const concat_t&) -> value_result_t {
            auto text = apply_text(node, record);
            if (!schema::is_ok(text)) {
              return schema::error_of(text);
            }
            return coerce(schema::make_string_attribute(
                              schema::value_of(std::move(text))),
                          kind);
          }},
      node.node);
}

}  // namespace lexkey::extraction
