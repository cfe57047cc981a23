#include <lexkey/common/critical.hpp>
#include <lexkey/index/val_def.hpp>
#include <lexkey/pattern/parser.hpp>
#include <lexkey/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

using lexkey::schema::attribute_kind_t;

namespace lexkey::index {

extraction::extraction_node_t val_def_t::extraction() const {
  return std::visit(
      overloaded{
          [](const std::monostate&) -> extraction::extraction_node_t {
            lexkey::common::critical("key value has no value source");
          },
          [](const format_source_t& format) {
            return extraction::build(format.spec);
          },
          [](const field_source_t& field) {
            return extraction::build_field(field.path);
          },
          [](const constant_source_t& constant) {
            return extraction::build_constant(constant.value);
          }},
      source);
}

val_def_t fmt(const std::string_view raw) {
  return val_def_t{.source = format_source_t{pattern::must_parse(
                       raw, attribute_kind_t::string)}};
}

val_def_t num_fmt(const std::string_view raw) {
  return val_def_t{.source = format_source_t{pattern::must_parse(
                       raw, attribute_kind_t::number)}};
}

val_def_t bytes_fmt(const std::string_view raw) {
  return val_def_t{.source = format_source_t{pattern::must_parse(
                       raw, attribute_kind_t::binary)}};
}

val_def_t from_field(const std::string_view path) {
  return val_def_t{.source = field_source_t{std::string{path}}};
}

val_def_t string_constant(const std::string_view value) {
  return val_def_t{.source = constant_source_t{
                       schema::make_string_attribute(std::string{value})}};
}

val_def_t number_constant(const int64_t value) {
  return val_def_t{.source = constant_source_t{
                       schema::make_number_attribute(fmt::format("{}", value))}};
}

val_def_t number_constant(const double value) {
  return val_def_t{.source = constant_source_t{
                       schema::make_number_attribute(fmt::format("{}", value))}};
}

val_def_t bytes_constant(const std::string_view encoded) {
  auto decoded = schema::try_from_base64(encoded);
  if (!decoded) {
    lexkey::common::critical("bytes constant \"{}\" is not valid base64",
                             encoded);
  }
  return val_def_t{.source = constant_source_t{
                       schema::make_binary_attribute(std::move(*decoded))}};
}

}  // namespace lexkey::index
