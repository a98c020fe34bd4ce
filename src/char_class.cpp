#include "identpick/char_class.h"
#include <unicode/uchar.h>
#include <string_view>

namespace identpick {

bool isIdentChar(char32_t c) {
    if (c == U'_') return true;
    switch (u_charType(static_cast<UChar32>(c))) {
        case U_UPPERCASE_LETTER:
        case U_LOWERCASE_LETTER:
        case U_TITLECASE_LETTER:
        case U_MODIFIER_LETTER:
        case U_OTHER_LETTER:
        case U_DECIMAL_DIGIT_NUMBER:
            return true;
        default:
            return false;
    }
}

bool isLatinChar(char32_t c) {
    char name[256];
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = u_charName(static_cast<UChar32>(c), U_UNICODE_CHAR_NAME,
                             name, static_cast<int32_t>(sizeof(name)), &status);
    if (U_SUCCESS(status) && len > 0) {
        return std::string_view(name, static_cast<size_t>(len)).find("LATIN") !=
               std::string_view::npos;
    }
    // Controls, private use and unassigned code points have no name
    return c <= 0x024F || (c >= 0x1E00 && c <= 0x1EFF);
}

bool isDecimalDigit(char32_t c) {
    return u_charType(static_cast<UChar32>(c)) == U_DECIMAL_DIGIT_NUMBER;
}

bool isCombiningMark(char32_t c) {
    return u_getCombiningClass(static_cast<UChar32>(c)) != 0;
}

} // namespace identpick
