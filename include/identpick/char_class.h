#pragma once

namespace identpick {

/// True for '_', any letter (Lu, Ll, Lt, Lm, Lo) of any script, or a decimal
/// digit (Nd).
bool isIdentChar(char32_t c);

/// True if the character's Unicode name contains "LATIN". Unnamed code points
/// fall back to the Basic Latin through Latin Extended-B and Latin Extended
/// Additional ranges.
bool isLatinChar(char32_t c);

/// General category Nd, in any script.
bool isDecimalDigit(char32_t c);

/// Non-zero canonical combining class.
bool isCombiningMark(char32_t c);

} // namespace identpick
