#include <lexkey/schema/semantic_type.hpp>

#include <algorithm>
#include <array>

namespace lexkey::schema {

namespace {

constexpr auto kTextTypes = std::array<std::string_view, 3>{
    "string", "std::string", "std::string_view"};

constexpr auto kSignedTypes = std::array<std::string_view, 14>{
    "int",     "int8",    "int16",   "int32",   "int64",
    "int8_t",  "int16_t", "int32_t", "int64_t", "short",
    "long",    "long long", "std::int32_t", "std::int64_t"};

constexpr auto kUnsignedTypes = std::array<std::string_view, 14>{
    "uint",          "uint8",         "uint16",       "uint32",
    "uint64",        "uint8_t",       "uint16_t",     "uint32_t",
    "uint64_t",      "unsigned",      "unsigned long", "size_t",
    "std::uint32_t", "std::uint64_t"};

constexpr auto kFloatTypes = std::array<std::string_view, 4>{
    "float32", "float64", "float", "double"};

constexpr auto kTemporalTypes = std::array<std::string_view, 4>{
    "time.Time", "Time", "timestamp", "std::chrono::system_clock::time_point"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names,
              const std::string_view name) {
  return std::ranges::find(names, name) != std::end(names);
}

}  // namespace

semantic_type_t classify(const std::string_view type_name) {
  if (contains(kTextTypes, type_name)) {
    return semantic_type_t::text;
  }
  if (contains(kSignedTypes, type_name)) {
    return semantic_type_t::signed_integer;
  }
  if (contains(kUnsignedTypes, type_name)) {
    return semantic_type_t::unsigned_integer;
  }
  if (contains(kFloatTypes, type_name)) {
    return semantic_type_t::floating_point;
  }
  if (contains(kTemporalTypes, type_name)) {
    return semantic_type_t::temporal;
  }
  return semantic_type_t::other;
}

}  // namespace lexkey::schema
