#include <lexkey/conversion/encoder.hpp>
#include <lexkey/index/render.hpp>
#include <lexkey/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

using lexkey::schema::attribute_kind_t;
using lexkey::schema::error_code_t;

namespace lexkey::index {

namespace {

std::string_view lookup_name(const conversion::value_source_t& source) {
  return std::visit(
      overloaded{[](const conversion::named_input_t& input) {
                   return std::string_view{input.name};
                 },
                 [](const conversion::field_access_t& access) {
                   return std::string_view{access.path};
                 }},
      source);
}

}  // namespace

schema::result_t<std::string> render_text(const compiled_key_t& key,
                                          const schema::field_values_t& values,
                                          const render_side_t side) {
  auto out = std::string{};
  for (const auto& part : key.parts) {
    if (const auto* literal = std::get_if<literal_part_t>(&part)) {
      out += literal->value;
      continue;
    }
    const auto& parameter = std::get<parameter_part_t>(part);
    const auto& descriptor = side == render_side_t::parameter
                                 ? parameter.parameter_side
                                 : parameter.entity_side;
    auto name = lookup_name(descriptor.expression.source);
    auto found = values.find(name);
    if (found == std::end(values)) {
      return schema::make_error(
          error_code_t::field_not_found,
          fmt::format("{}: no {} value for \"{}\"", key.key_name,
                      to_string(side), name));
    }
    auto encoded = conversion::encode(descriptor, found->second);
    if (!schema::is_ok(encoded)) {
      return schema::wrap_error(fmt::format("{}: {}", key.key_name, name),
                                schema::error_of(encoded));
    }
    out += schema::value_of(encoded);
  }
  return out;
}

schema::result_t<schema::attribute_value_t> render(
    const compiled_key_t& key,
    const schema::field_values_t& values,
    const render_side_t side) {
  auto text = render_text(key, values, side);
  if (!schema::is_ok(text)) {
    return schema::error_of(text);
  }
  auto& rendered = std::get<std::string>(text);
  switch (key.kind) {
    case attribute_kind_t::string:
      return schema::make_string_attribute(std::move(rendered));
    case attribute_kind_t::number:
      return schema::make_number_attribute(std::move(rendered));
    case attribute_kind_t::binary:
      break;
  }
  if (key.is_constant) {
    auto decoded = schema::try_from_base64(rendered);
    if (!decoded) {
      return schema::make_error(
          error_code_t::invalid_binary_literal,
          fmt::format("{}: constant is not valid base64", key.key_name));
    }
    return schema::make_binary_attribute(std::move(*decoded));
  }
  return schema::make_binary_attribute(
      schema::make_bytes(std::string_view{rendered}));
}

std::string begins_with(const compiled_key_t& key,
                        const std::string_view suffix) {
  return key.literal_prefix + std::string{suffix};
}

}  // namespace lexkey::index
