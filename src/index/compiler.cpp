#include <lexkey/conversion/engine.hpp>
#include <lexkey/index/compiler.hpp>
#include <lexkey/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <utility>

using lexkey::schema::error_code_t;
using lexkey::schema::make_error;

namespace lexkey::index {

namespace {

using key_result_t = schema::result_t<compiled_key_t>;

// Text form of a constant as it appears in generated code and prefixes;
// binary constants stay base64.
std::string constant_text(const schema::attribute_value_t& value) {
  return std::visit(
      overloaded{
          [](const schema::string_attribute_t& text) { return text.value; },
          [](const schema::number_attribute_t& number) { return number.value; },
          [](const schema::binary_attribute_t& bytes) {
            return schema::to_base64(schema::make_bytes_view(bytes.value));
          },
          [](const auto&) { return std::string{}; }},
      value.value);
}

void update_capabilities(compiled_key_t& key,
                         const conversion::conversion_descriptor_t& descriptor) {
  key.requires_numeric_library |= descriptor.requires_numeric_library;
  key.requires_temporal_library |= descriptor.requires_temporal_library;
}

std::optional<schema::key_error_t> add_parameter(
    compiled_key_t& key,
    const pattern::field_ref_t& ref,
    const schema::field_type_table_t& field_types,
    const std::string_view entity_label,
    const bool sort_position,
    const bool field_copy,
    std::vector<sortability::diagnostic_t>& diagnostics) {
  auto found = field_types.find(ref.path);
  if (found == std::end(field_types)) {
    return make_error(error_code_t::unknown_field,
                      fmt::format("field \"{}\" not found in {}", ref.path,
                                  entity_label),
                      ref.offset);
  }
  auto name = ref.parameter_name();
  auto clash = std::ranges::find_if(key.parameters, [&](const auto& parameter) {
    return parameter.name == name && parameter.field_path != ref.path;
  });
  if (clash != std::end(key.parameters)) {
    return make_error(error_code_t::invalid_index_definition,
                      fmt::format("fields \"{}\" and \"{}\" both map to "
                                  "parameter \"{}\"",
                                  clash->field_path, ref.path, name),
                      ref.offset);
  }
  auto type = schema::classify(found->second);
  // Field copies take the stored value as is; only text keeps identity.
  auto conversion_type = field_copy && type != schema::semantic_type_t::text
                             ? schema::semantic_type_t::other
                             : type;

  auto parameter_side = conversion::convert(ref, conversion_type);
  if (!schema::is_ok(parameter_side)) {
    return schema::error_of(parameter_side);
  }
  auto entity_side = conversion::convert(ref, conversion_type,
                                         conversion::field_access_t{ref.path});
  if (!schema::is_ok(entity_side)) {
    return schema::error_of(entity_side);
  }

  if (sort_position && !field_copy) {
    if (auto diagnostic =
            sortability::check_sort_safety(ref, type, entity_label)) {
      diagnostics.push_back(std::move(*diagnostic));
    }
  }

  auto part = parameter_part_t{
      .ref = ref,
      .parameter_side = schema::value_of(std::move(parameter_side)),
      .entity_side = schema::value_of(std::move(entity_side))};
  update_capabilities(key, part.parameter_side);

  auto known = std::ranges::any_of(key.parameters, [&](const auto& parameter) {
    return parameter.field_path == ref.path;
  });
  if (!known) {
    key.parameters.push_back(parameter_t{.name = std::move(name),
                                         .field_path = ref.path,
                                         .type_name = found->second,
                                         .type = type});
  }
  key.parts.emplace_back(std::move(part));
  return std::nullopt;
}

schema::result_t<compiled_gsi_t> compile_gsi(
    const secondary_index_t& gsi,
    const index_binding_t& binding,
    std::vector<sortability::diagnostic_t>& diagnostics) {
  auto compiled = compiled_gsi_t{};
  compiled.name = gsi.name();

  auto partition =
      compile_key(gsi.gsi.keys.partition_key, gsi.partition,
                  binding.field_types, binding.entity_label, false, diagnostics);
  if (!schema::is_ok(partition)) {
    return schema::wrap_error("partition key", schema::error_of(partition));
  }
  compiled.partition = schema::value_of(std::move(partition));

  if (gsi.gsi.keys.sort_key && gsi.sort && gsi.sort->has_value_source()) {
    auto sort =
        compile_key(*gsi.gsi.keys.sort_key, *gsi.sort, binding.field_types,
                    binding.entity_label, true, diagnostics);
    if (!schema::is_ok(sort)) {
      return schema::wrap_error("sort key", schema::error_of(sort));
    }
    compiled.sort = schema::value_of(std::move(sort));
  }
  return compiled;
}

}  // namespace

bool compiled_index_t::requires_numeric_library() const {
  auto required = partition.requires_numeric_library ||
                  (sort && sort->requires_numeric_library);
  for (const auto& gsi : gsis) {
    required = required || gsi.partition.requires_numeric_library ||
               (gsi.sort && gsi.sort->requires_numeric_library);
  }
  return required;
}

bool compiled_index_t::requires_temporal_library() const {
  auto required = partition.requires_temporal_library ||
                  (sort && sort->requires_temporal_library);
  for (const auto& gsi : gsis) {
    required = required || gsi.partition.requires_temporal_library ||
               (gsi.sort && gsi.sort->requires_temporal_library);
  }
  return required;
}

key_result_t compile_key(const key_def_t& key,
                         const val_def_t& value,
                         const schema::field_type_table_t& field_types,
                         const std::string_view entity_label,
                         const bool sort_position,
                         std::vector<sortability::diagnostic_t>& diagnostics) {
  auto compiled = compiled_key_t{};
  compiled.key_name = key.name;
  compiled.kind = key.kind;

  auto failure = std::visit(
      overloaded{
          [&](const std::monostate&) -> std::optional<schema::key_error_t> {
            return make_error(
                error_code_t::invalid_index_definition,
                fmt::format("key \"{}\" has no value source", key.name));
          },
          [&](const constant_source_t& constant)
              -> std::optional<schema::key_error_t> {
            auto text = constant_text(constant.value);
            compiled.parts.emplace_back(literal_part_t{text});
            compiled.literal_prefix = std::move(text);
            compiled.is_constant = true;
            return std::nullopt;
          },
          [&](const field_source_t& field)
              -> std::optional<schema::key_error_t> {
            auto ref = pattern::field_ref_t{};
            ref.path = field.path;
            return add_parameter(compiled, ref, field_types, entity_label,
                                 sort_position, true, diagnostics);
          },
          [&](const format_source_t& format)
              -> std::optional<schema::key_error_t> {
            compiled.literal_prefix = format.spec.literal_prefix();
            compiled.is_constant = format.spec.is_constant();
            for (const auto& segment : format.spec.segments()) {
              if (const auto* literal =
                      std::get_if<pattern::literal_segment_t>(&segment)) {
                compiled.parts.emplace_back(literal_part_t{literal->value});
                continue;
              }
              if (auto error = add_parameter(
                      compiled, std::get<pattern::field_ref_t>(segment),
                      field_types, entity_label, sort_position, false,
                      diagnostics)) {
                return error;
              }
            }
            return std::nullopt;
          }},
      value.source);
  if (failure) {
    return std::move(*failure);
  }
  return compiled;
}

schema::result_t<compiled_index_t> compile(const index_binding_t& binding) {
  const auto& index = binding.index;
  if (auto error = index.validate()) {
    return std::move(*error);
  }

  auto compiled = compiled_index_t{};
  compiled.entity_label = binding.entity_label;
  compiled.table_name = index.table.name;

  auto partition =
      compile_key(index.table.keys.partition_key, index.partition_key,
                  binding.field_types, binding.entity_label, false,
                  compiled.diagnostics);
  if (!schema::is_ok(partition)) {
    return schema::wrap_error("partition key", schema::error_of(partition));
  }
  compiled.partition = schema::value_of(std::move(partition));

  if (index.table.keys.sort_key && index.sort_key &&
      index.sort_key->has_value_source()) {
    auto sort = compile_key(*index.table.keys.sort_key, *index.sort_key,
                            binding.field_types, binding.entity_label, true,
                            compiled.diagnostics);
    if (!schema::is_ok(sort)) {
      return schema::wrap_error("sort key", schema::error_of(sort));
    }
    compiled.sort = schema::value_of(std::move(sort));
  }

  for (const auto& gsi : index.secondary) {
    auto compiled_gsi = compile_gsi(gsi, binding, compiled.diagnostics);
    if (!schema::is_ok(compiled_gsi)) {
      return schema::wrap_error(fmt::format("GSI {}", gsi.name()),
                                schema::error_of(compiled_gsi));
    }
    compiled.gsis.push_back(schema::value_of(std::move(compiled_gsi)));
  }
  return compiled;
}

}  // namespace lexkey::index
