#include "identpick/unicode_util.h"
#include "identpick/error.h"
#include "identpick/log.h"
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace identpick {

namespace {

icu::UnicodeString fromUtf8(std::string_view text) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

std::string toUtf8(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

std::u32string toCodePoints(const icu::UnicodeString& text) {
    std::u32string out;
    out.reserve(static_cast<size_t>(text.length()));
    for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
        out.push_back(static_cast<char32_t>(text.char32At(i)));
    }
    return out;
}

void checkStatus(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        LOG_ERROR << what << ": " << u_errorName(status);
        throw UnicodeError(std::string(what) + ": " + u_errorName(status), status);
    }
}

std::u32string normalizeOne(const icu::Normalizer2& normalizer, char32_t c, const char* what) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString out =
        normalizer.normalize(icu::UnicodeString(static_cast<UChar32>(c)), status);
    checkStatus(status, what);
    return toCodePoints(out);
}

} // namespace

std::u32string decodeUtf8(std::string_view text) {
    return toCodePoints(fromUtf8(text));
}

std::string encodeUtf8(std::u32string_view text) {
    icu::UnicodeString out;
    for (char32_t c : text) {
        out.append(static_cast<UChar32>(c));
    }
    return toUtf8(out);
}

std::string encodeUtf8(char32_t c) {
    return toUtf8(icu::UnicodeString(static_cast<UChar32>(c)));
}

std::string toUpper(std::string_view text) {
    icu::UnicodeString s = fromUtf8(text);
    s.toUpper(icu::Locale::getRoot());
    return toUtf8(s);
}

std::string toLower(std::string_view text) {
    icu::UnicodeString s = fromUtf8(text);
    s.toLower(icu::Locale::getRoot());
    return toUtf8(s);
}

std::string toTitle(char32_t c) {
    icu::UnicodeString s(static_cast<UChar32>(c));
    s.toTitle(nullptr, icu::Locale::getRoot());
    return toUtf8(s);
}

char32_t toTitleSimple(char32_t c) {
    return static_cast<char32_t>(u_totitle(static_cast<UChar32>(c)));
}

std::u32string normalizeNfkd(char32_t c) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    checkStatus(status, "NFKD normalizer unavailable");
    return normalizeOne(*nfkd, c, "NFKD normalization failed");
}

std::u32string normalizeNfc(char32_t c) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    checkStatus(status, "NFC normalizer unavailable");
    return normalizeOne(*nfc, c, "NFC normalization failed");
}

} // namespace identpick
