#pragma once

#include <lexkey/conversion/descriptor.hpp>
#include <lexkey/conversion/value_source.hpp>
#include <lexkey/pattern/segment.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/semantic_type.hpp>

// Type-aware conversion: decides, for one field reference and the declared
// type of its field, how a value becomes key text.
//
//   text      width spec -> printf_format, otherwise identity
//   integer   width spec -> printf_format, otherwise decimal
//   float     width spec or primary modifier required
//   temporal  [utc:]unix|unixmilli|unixnano|rfc3339|rfc3339fixed|
//             rfc3339nano|<layout>
//   other     best_effort_string
//
// Pure: the same inputs always produce the same descriptor. Index assembly
// calls it once per side (named input and entity field access).
namespace lexkey::conversion {

/// Name of the only defined pre-transform modifier.
inline constexpr auto kUtcModifier = std::string_view{"utc"};

schema::result_t<conversion_descriptor_t> convert(
    const pattern::field_ref_t& ref,
    schema::semantic_type_t type,
    const value_source_t& source);

/// Reads from a named input called after the reference's last path
/// component.
schema::result_t<conversion_descriptor_t> convert(
    const pattern::field_ref_t& ref,
    schema::semantic_type_t type);

}  // namespace lexkey::conversion
