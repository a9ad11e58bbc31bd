// Conversion of fixture names into test function identifiers.
#pragma once

#include <string>
#include <string_view>

namespace jsonconf::codegen {

// Map a fixture stem to a C++ identifier. Applied in order:
//   "UTF-8" -> "utf8", "U+" -> "u", '+' -> "_plus_", '-' -> "_minus_",
//   '.' and '#' -> '_', runs of '_' collapsed, ASCII lower-cased.
// Idempotent. Characters outside [A-Za-z0-9._+#-] pass through unchanged,
// so the result must still be checked with `is_valid_identifier`.
std::string sanitize_identifier(std::string_view text);

// True for [A-Za-z_][A-Za-z0-9_]*.
bool is_valid_identifier(std::string_view text);

} // namespace jsonconf::codegen
