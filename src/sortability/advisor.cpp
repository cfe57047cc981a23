#include <lexkey/conversion/engine.hpp>
#include <lexkey/conversion/width_spec.hpp>
#include <lexkey/sortability/advisor.hpp>

#include <spdlog/fmt/fmt.h>

namespace lexkey::sortability {

namespace {

struct epoch_hint_t final {
  std::string_view format;
  int digits_before;
  std::string_view padding;
};

// Digit counts on either side of 2001-09-09T01:46:40Z.
constexpr auto kEpochHints = std::array{
    epoch_hint_t{"unix", 9, "%011d"},
    epoch_hint_t{"unixmilli", 12, "%014d"},
    epoch_hint_t{"unixnano", 18, "%020d"}};

diagnostic_t make_diagnostic(const std::string_view entity_label,
                             const pattern::field_ref_t& ref,
                             const unsafe_condition_t condition,
                             std::string cause,
                             std::string suggestion) {
  return diagnostic_t{.entity_label = std::string{entity_label},
                      .field_path = ref.path,
                      .condition = condition,
                      .cause = std::move(cause),
                      .suggestion = std::move(suggestion)};
}

std::optional<diagnostic_t> check_temporal(const pattern::field_ref_t& ref,
                                           const std::string_view label) {
  auto primary = ref.primary_format();
  if (!primary) {
    return std::nullopt;
  }
  for (const auto& hint : kEpochHints) {
    if (*primary != hint.format) {
      continue;
    }
    if (conversion::has_padding(ref.width_spec)) {
      return std::nullopt;
    }
    return make_diagnostic(
        label, ref, unsafe_condition_t::unpadded_epoch_counter,
        fmt::format("\"{}\" timestamps change digit count ({} digits before "
                    "2001-09-09, {} after)",
                    hint.format, hint.digits_before, hint.digits_before + 1),
        fmt::format("add padding: {{{}:{}:{}}}", ref.path, hint.format,
                    hint.padding));
  }
  if (*primary == "rfc3339" || *primary == "rfc3339nano") {
    return make_diagnostic(
        label, ref, unsafe_condition_t::variable_width_timestamp,
        fmt::format("\"{}\" has variable width (timezone offsets, stripped "
                    "fractions), string order is unreliable",
                    *primary),
        fmt::format("use {{{0}:utc:rfc3339fixed}} or a padded epoch counter "
                    "such as {{{0}:unixnano:%020d}}",
                    ref.path));
  }
  if (*primary == "rfc3339fixed" && !ref.has_modifier(conversion::kUtcModifier)) {
    return make_diagnostic(
        label, ref, unsafe_condition_t::timezone_dependent_timestamp,
        "\"rfc3339fixed\" without utc keeps the observed offset, so "
        "\"...+05:00\" sorts after \"...Z\"",
        fmt::format("normalize to UTC: {{{}:utc:rfc3339fixed}}", ref.path));
  }
  return std::nullopt;
}

}  // namespace

std::string diagnostic_t::message() const {
  return fmt::format("{} sort key field {}: {}; {}", entity_label, field_path,
                     cause, suggestion);
}

std::optional<diagnostic_t> check_sort_safety(
    const pattern::field_ref_t& ref,
    const schema::semantic_type_t type,
    const std::string_view entity_label) {
  if (schema::is_integer(type)) {
    if (conversion::has_padding(ref.width_spec)) {
      return std::nullopt;
    }
    return make_diagnostic(
        entity_label, ref, unsafe_condition_t::unpadded_integer,
        "integer without padding format, string comparison treats \"9\" > "
        "\"10\"",
        fmt::format("add zero-padding: {{{}:%020d}}, or use a number key",
                    ref.path));
  }
  if (type == schema::semantic_type_t::floating_point) {
    if (conversion::has_padding(ref.width_spec)) {
      return std::nullopt;
    }
    auto format = ref.width_spec ? std::string_view{*ref.width_spec}
                                 : ref.primary_format().value_or("");
    return make_diagnostic(
        entity_label, ref, unsafe_condition_t::unpadded_float,
        fmt::format("float format \"{}\" has no total width padding", format),
        fmt::format("specify total width: {{{}:%020.2f}}", ref.path));
  }
  if (type == schema::semantic_type_t::temporal) {
    return check_temporal(ref, entity_label);
  }
  return std::nullopt;
}

std::vector<diagnostic_t> check_sort_safety(
    const pattern::pattern_spec& spec,
    const schema::field_type_table_t& field_types,
    const std::string_view entity_label) {
  auto diagnostics = std::vector<diagnostic_t>{};
  for (const auto& ref : spec.field_refs()) {
    auto found = field_types.find(ref.path);
    auto type = found == std::end(field_types)
                    ? schema::semantic_type_t::other
                    : schema::classify(found->second);
    if (auto diagnostic = check_sort_safety(ref, type, entity_label)) {
      diagnostics.push_back(std::move(*diagnostic));
    }
  }
  return diagnostics;
}

}  // namespace lexkey::sortability
