#pragma once

#include <lexkey/schema/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// printf-style width spec carried as the last token of a field reference:
//   '%' [-+ #0]* width? ('.' precision)? conversion
namespace lexkey::conversion {

enum class value_family_t : uint8_t { integer, floating_point, text };

struct width_spec_t final {
  std::string flags;
  // Both capped at 64.
  std::optional<int> width;
  std::optional<int> precision;
  char conversion{};

  bool zero_padded() const;
};

schema::result_t<width_spec_t> parse_width_spec(std::string_view spec);

/// Parses `spec` and checks that its conversion fits `family`. The error
/// is `invalid_width_spec` either way.
std::optional<schema::key_error_t> validate_width_spec(std::string_view spec,
                                                       value_family_t family);

/// True when `spec` zero-pads to an explicit total width ("%020d",
/// "%015.2f"). "%0d" and "%.2f" have no width and do not pad.
bool has_padding(const std::optional<std::string>& spec);

}  // namespace lexkey::conversion
