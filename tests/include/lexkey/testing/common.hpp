#pragma once

#include <gtest/gtest.h>
#include <lexkey/index/primary_index.hpp>
#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/attribute_value.hpp>
#include <lexkey/schema/error.hpp>
#include <lexkey/schema/field_value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace lexkey::testing {

// 2023-11-14T22:13:20Z
inline constexpr auto kSampleUnixNanos = int64_t{1'700'000'000'000'000'000};

inline lexkey::schema::timestamp_t make_timestamp(
    const int64_t unix_nanos,
    const int32_t offset_seconds = 0) {
  return lexkey::schema::timestamp_t{.unix_nanos = unix_nanos,
                                     .offset_seconds = offset_seconds};
}

/// Parses `raw`, failing the current test when it is rejected.
inline lexkey::pattern::pattern_spec parse_ok(
    const std::string_view raw,
    const lexkey::schema::attribute_kind_t kind =
        lexkey::schema::attribute_kind_t::string) {
  auto parsed = lexkey::pattern::parse(raw, kind);
  if (!lexkey::schema::is_ok(parsed)) {
    ADD_FAILURE() << "pattern \"" << raw << "\" rejected: "
                  << lexkey::schema::error_of(parsed).message;
    return std::get<lexkey::pattern::pattern_spec>(
        lexkey::pattern::parse("INVALID"));
  }
  return lexkey::schema::value_of(std::move(parsed));
}

template <typename T>
lexkey::schema::error_code_t error_code(const lexkey::schema::result_t<T>& result) {
  if (lexkey::schema::is_ok(result)) {
    ADD_FAILURE() << "expected an error";
    return lexkey::schema::error_code_t{};
  }
  return lexkey::schema::error_of(result).code;
}

inline lexkey::schema::attribute_value_t text(std::string value) {
  return lexkey::schema::make_string_attribute(std::move(value));
}

inline lexkey::schema::attribute_value_t number(std::string value) {
  return lexkey::schema::make_number_attribute(std::move(value));
}

/// Single-table layout used across the index tests: pk/sk plus one GSI
/// keyed by gsi1pk/gsi1sk.
inline lexkey::index::table_definition_t make_table() {
  using lexkey::schema::attribute_kind_t;
  return lexkey::index::table_definition_t{
      .name = "app",
      .keys = {.partition_key = {.name = "pk", .kind = attribute_kind_t::string},
               .sort_key = lexkey::index::key_def_t{
                   .name = "sk", .kind = attribute_kind_t::string}},
      .time_to_live_key = "expires_at",
      .gsis = {lexkey::index::gsi_definition_t{
          .name = "by_email",
          .keys = {.partition_key = {.name = "gsi1pk",
                                     .kind = attribute_kind_t::string},
                   .sort_key = lexkey::index::key_def_t{
                       .name = "gsi1sk",
                       .kind = attribute_kind_t::string}}}}};
}

/// USER#{id} / PROFILE with an email GSI.
inline lexkey::index::primary_index_t make_user_index() {
  auto table = make_table();
  return lexkey::index::primary_index_t{
      .table = table,
      .partition_key = lexkey::index::fmt("USER#{id}"),
      .sort_key = lexkey::index::string_constant("PROFILE"),
      .secondary = {lexkey::index::secondary_index_t{
          .gsi = table.gsis.front(),
          .partition = lexkey::index::fmt("EMAIL#{email}"),
          .sort = lexkey::index::fmt("USER#{id}")}}};
}

}  // namespace lexkey::testing
