#pragma once

#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/attribute_kind.hpp>

#include <string_view>

// Key pattern grammar:
//
//   pattern   := (literal | reference)+
//   reference := '{' path (':' modifier)* (':' '%' printf)? '}'
//   path      := identifier ('.' identifier)*
//
// Only the last ':' token may be a printf width spec; a '%' token anywhere
// else is kept as a modifier. There is no escape for literal braces: a '}'
// outside a reference, an unterminated '{' and a '{' inside a reference are
// rejected with `unbalanced_brace`.
//
//   "PROFILE"                    constant
//   "USER#{id}"                  literal prefix + reference
//   "ORDER#{tenant}#{id}"        two references, order preserved
//   "{user.id}"                  nested path
//   "{ts:utc:unixnano:%020d}"    pre-transform, format and width spec
namespace lexkey::pattern {

/// Parse for static definitions: a malformed pattern is a programmer error
/// and terminates through `lexkey::common::critical`.
pattern_spec must_parse(
    std::string_view raw,
    schema::attribute_kind_t kind = schema::attribute_kind_t::string);

}  // namespace lexkey::pattern
