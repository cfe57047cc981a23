#include <lexkey/common/critical.hpp>
#include <lexkey/pattern/parser.hpp>
#include <lexkey/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <iterator>
#include <utility>

using lexkey::schema::error_code_t;
using lexkey::schema::make_error;

namespace lexkey::pattern {

namespace {

using field_ref_result_t = lexkey::schema::result_t<field_ref_t>;

// `body` is the text between the braces; `offset` is the position of '{'.
field_ref_result_t parse_field_ref(const std::string_view body,
                                   const std::size_t offset) {
  auto tokens = lexkey::schema::split(body, ':');
  auto ref = field_ref_t{};
  ref.offset = offset;
  ref.path = tokens.front();

  auto component_offset = offset + 1;
  for (const auto& component : lexkey::schema::split(ref.path, '.')) {
    if (component.empty()) {
      return make_error(error_code_t::invalid_field_path,
                        fmt::format("invalid field path \"{}\": empty "
                                    "component at position {}",
                                    ref.path, component_offset),
                        component_offset);
    }
    component_offset += component.size() + 1;
  }

  if (tokens.size() == 1) {
    return ref;
  }
  auto last = tokens.size();
  if (tokens.back().starts_with('%')) {
    ref.width_spec = tokens.back();
    --last;
  }
  ref.modifiers.assign(std::next(std::begin(tokens)),
                       std::next(std::begin(tokens),
                                 static_cast<std::ptrdiff_t>(last)));
  return ref;
}

}  // namespace

lexkey::schema::result_t<pattern_spec> parse(
    const std::string_view raw,
    const lexkey::schema::attribute_kind_t kind) {
  if (raw.empty()) {
    return make_error(error_code_t::empty_pattern, "pattern cannot be empty",
                      std::size_t{0});
  }

  auto segments = std::vector<segment_t>{};
  auto literal_start = std::size_t{0};
  auto position = std::size_t{0};
  while (position < raw.size()) {
    if (raw[position] == '}') {
      return make_error(
          error_code_t::unbalanced_brace,
          fmt::format("unmatched '}}' at position {}", position), position);
    }
    if (raw[position] != '{') {
      ++position;
      continue;
    }

    auto close = raw.find('}', position + 1);
    if (close == std::string_view::npos) {
      return make_error(
          error_code_t::unbalanced_brace,
          fmt::format("unterminated field reference at position {}", position),
          position);
    }
    auto body = raw.substr(position + 1, close - position - 1);
    if (auto nested = body.find('{'); nested != std::string_view::npos) {
      return make_error(error_code_t::unbalanced_brace,
                        fmt::format("nested '{{' at position {}",
                                    position + 1 + nested),
                        position + 1 + nested);
    }
    if (body.empty()) {
      return make_error(
          error_code_t::empty_field_reference,
          fmt::format("empty field reference at position {}", position),
          position);
    }

    auto ref = parse_field_ref(body, position);
    if (!lexkey::schema::is_ok(ref)) {
      return lexkey::schema::error_of(ref);
    }
    if (position > literal_start) {
      segments.emplace_back(literal_segment_t{
          std::string{raw.substr(literal_start, position - literal_start)}});
    }
    segments.emplace_back(lexkey::schema::value_of(std::move(ref)));
    position = close + 1;
    literal_start = position;
  }
  if (literal_start < raw.size()) {
    segments.emplace_back(
        literal_segment_t{std::string{raw.substr(literal_start)}});
  }

  auto spec = pattern_spec{std::string{raw}, kind, std::move(segments)};
  if (kind == lexkey::schema::attribute_kind_t::binary && spec.is_constant() &&
      !lexkey::schema::try_from_base64(raw).has_value()) {
    return make_error(error_code_t::invalid_binary_literal,
                      "binary constant pattern must be valid base64",
                      std::size_t{0});
  }
  return spec;
}

pattern_spec must_parse(const std::string_view raw,
                        const lexkey::schema::attribute_kind_t kind) {
  auto parsed = parse(raw, kind);
  if (!lexkey::schema::is_ok(parsed)) {
    const auto& error = lexkey::schema::error_of(parsed);
    lexkey::common::critical("invalid key pattern \"{}\": {}", raw,
                             error.message);
  }
  return lexkey::schema::value_of(std::move(parsed));
}

}  // namespace lexkey::pattern
