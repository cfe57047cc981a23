#include <lexkey/conversion/engine.hpp>
#include <lexkey/conversion/width_spec.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <map>
#include <string_view>
#include <utility>

using lexkey::schema::error_code_t;
using lexkey::schema::make_error;
using lexkey::schema::semantic_type_t;

namespace lexkey::conversion {

namespace {

using descriptor_result_t = schema::result_t<conversion_descriptor_t>;

const auto kTemporalFormats = std::map<std::string_view, transform_t>{
    {"unix", transform_t::epoch_seconds},
    {"unixmilli", transform_t::epoch_millis},
    {"unixnano", transform_t::epoch_nanos},
    {"rfc3339", transform_t::rfc3339},
    {"rfc3339fixed", transform_t::rfc3339_fixed},
    {"rfc3339nano", transform_t::rfc3339_nano}};

bool needs_numeric_library(const transform_t transform) {
  switch (transform) {
    case transform_t::printf_format:
    case transform_t::decimal:
    case transform_t::epoch_seconds:
    case transform_t::epoch_millis:
    case transform_t::epoch_nanos:
    case transform_t::best_effort_string:
      return true;
    default:
      return false;
  }
}

conversion_descriptor_t make_descriptor(const transform_t transform,
                                        const value_source_t& source,
                                        std::optional<std::string> format,
                                        const bool utc_normalize = false) {
  return conversion_descriptor_t{
      .expression = conversion_expression_t{.transform = transform,
                                            .source = source,
                                            .format = std::move(format),
                                            .utc_normalize = utc_normalize},
      .requires_numeric_library = needs_numeric_library(transform),
      .requires_temporal_library = is_temporal(transform)};
}

descriptor_result_t convert_width_formatted(const pattern::field_ref_t& ref,
                                            const value_family_t family,
                                            const transform_t fallback,
                                            const value_source_t& source) {
  if (!ref.width_spec) {
    return make_descriptor(fallback, source, std::nullopt);
  }
  if (auto error = validate_width_spec(*ref.width_spec, family)) {
    return schema::wrap_error(ref.path, std::move(*error));
  }
  return make_descriptor(transform_t::printf_format, source, ref.width_spec);
}

descriptor_result_t convert_float(const pattern::field_ref_t& ref,
                                  const value_source_t& source) {
  auto format = std::optional<std::string>{};
  if (ref.width_spec) {
    format = ref.width_spec;
  } else if (auto primary = ref.primary_format()) {
    format = primary->starts_with('%') ? std::string{*primary}
                                       : "%" + std::string{*primary};
  } else {
    return make_error(
        error_code_t::missing_float_format,
        fmt::format("{}: float fields need a format such as %.2f or %020.6f",
                    ref.path),
        ref.offset);
  }
  if (auto error =
          validate_width_spec(*format, value_family_t::floating_point)) {
    return schema::wrap_error(ref.path, std::move(*error));
  }
  return make_descriptor(transform_t::printf_format, source, std::move(format));
}

descriptor_result_t convert_temporal(const pattern::field_ref_t& ref,
                                     const value_source_t& source) {
  auto primary = ref.primary_format();
  if (!primary || *primary == kUtcModifier) {
    return make_error(
        error_code_t::missing_temporal_format,
        fmt::format("{}: time fields need a format such as unix, rfc3339 or "
                    "a layout",
                    ref.path),
        ref.offset);
  }
  auto utc = std::any_of(std::begin(ref.modifiers),
                         std::prev(std::end(ref.modifiers)),
                         [](const auto& m) { return m == kUtcModifier; });

  auto found = kTemporalFormats.find(*primary);
  auto transform =
      found == std::end(kTemporalFormats) ? transform_t::custom_layout
                                          : found->second;
  switch (transform) {
    case transform_t::epoch_seconds:
    case transform_t::epoch_millis:
    case transform_t::epoch_nanos:
      if (ref.width_spec) {
        if (auto error =
                validate_width_spec(*ref.width_spec, value_family_t::integer)) {
          return schema::wrap_error(ref.path, std::move(*error));
        }
      }
      return make_descriptor(transform, source, ref.width_spec, utc);
    case transform_t::custom_layout:
      if (ref.width_spec) {
        break;
      }
      return make_descriptor(transform, source, std::string{*primary}, utc);
    default:
      if (ref.width_spec) {
        break;
      }
      return make_descriptor(transform, source, std::nullopt, utc);
  }
  return make_error(error_code_t::invalid_width_spec,
                    fmt::format("{}: width spec \"{}\" only applies to epoch "
                                "counters, not {}",
                                ref.path, *ref.width_spec, *primary),
                    ref.offset);
}

}  // namespace

descriptor_result_t convert(const pattern::field_ref_t& ref,
                            const semantic_type_t type,
                            const value_source_t& source) {
  switch (type) {
    case semantic_type_t::text:
      return convert_width_formatted(ref, value_family_t::text,
                                     transform_t::identity, source);
    case semantic_type_t::signed_integer:
    case semantic_type_t::unsigned_integer:
      return convert_width_formatted(ref, value_family_t::integer,
                                     transform_t::decimal, source);
    case semantic_type_t::floating_point:
      return convert_float(ref, source);
    case semantic_type_t::temporal:
      return convert_temporal(ref, source);
    case semantic_type_t::other:
      break;
  }
  return make_descriptor(transform_t::best_effort_string, source,
                         std::nullopt);
}

descriptor_result_t convert(const pattern::field_ref_t& ref,
                            const semantic_type_t type) {
  return convert(ref, type, named_input_t{ref.parameter_name()});
}

}  // namespace lexkey::conversion
