#pragma once

#include <string>
#include <string_view>

namespace identpick {

/// Decode UTF-8 into code points. Ill-formed sequences decode to U+FFFD
/// rather than failing.
std::u32string decodeUtf8(std::string_view text);

std::string encodeUtf8(std::u32string_view text);
std::string encodeUtf8(char32_t c);

// Full (possibly length-changing) case mappings in the root locale.
std::string toUpper(std::string_view text);
std::string toLower(std::string_view text);

/// Titlecase mapping of a single code point, e.g. U+01C6 -> U+01C5, 'ß' -> "Ss".
std::string toTitle(char32_t c);

/// Simple (one-to-one) titlecase mapping; never adds combining marks.
char32_t toTitleSimple(char32_t c);

// Per-code-point normalization. Both throw UnicodeError if ICU has no
// normalization data.
std::u32string normalizeNfkd(char32_t c);
std::u32string normalizeNfc(char32_t c);

} // namespace identpick
