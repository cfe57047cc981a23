#pragma once

#include <lexkey/pattern/segment.hpp>
#include <lexkey/schema/attribute_kind.hpp>
#include <lexkey/schema/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace lexkey::pattern {

class pattern_spec;

/// Parse a key pattern; see parser.hpp for the grammar.
schema::result_t<pattern_spec> parse(
    std::string_view raw,
    schema::attribute_kind_t kind = schema::attribute_kind_t::string);

/// Compiled key pattern.
///
/// Immutable once built; only `parse` constructs one, so `segments()` is
/// never empty. Safe to share across threads without synchronization.
class pattern_spec final {
 public:
  const std::string& raw() const { return raw_; }
  schema::attribute_kind_t kind() const { return kind_; }
  const std::vector<segment_t>& segments() const { return segments_; }

  /// True when the pattern is a single literal segment.
  bool is_constant() const;

  /// Literal text before the first field reference ("" when the pattern
  /// starts with one). For a constant pattern this is the whole literal.
  std::string literal_prefix() const;

  /// Field references in pattern order.
  std::vector<field_ref_t> field_refs() const;

  /// Dotted field paths in pattern order, e.g. {"tenant", "id"}.
  std::vector<std::string> field_paths() const;

  bool operator==(const pattern_spec&) const = default;

 private:
  friend schema::result_t<pattern_spec> parse(std::string_view raw,
                                      schema::attribute_kind_t kind);

  pattern_spec(std::string raw,
               schema::attribute_kind_t kind,
               std::vector<segment_t> segments);

  std::string raw_;
  schema::attribute_kind_t kind_{schema::attribute_kind_t::string};
  std::vector<segment_t> segments_;
};

}  // namespace lexkey::pattern
