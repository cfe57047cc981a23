#pragma once

#include <lexkey/conversion/descriptor.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/field_value.hpp>

#include <string>

namespace lexkey::conversion {

/// Evaluate a descriptor against a typed value. Fails with
/// `value_type_mismatch` when the value cannot go through the transform
/// (e.g. text through "%020d").
schema::result_t<std::string> encode(const conversion_descriptor_t& descriptor,
                                     const schema::field_value_t& value);

/// Canonical text of any value: decimal numbers, RFC 3339 (nano) times,
/// "true"/"false".
std::string to_display_string(const schema::field_value_t& value);

}  // namespace lexkey::conversion
