#include "identpick/sanitize.h"
#include "identpick/char_class.h"
#include "identpick/keywords.h"
#include "identpick/log.h"
#include "identpick/unicode_util.h"
#include <stdexcept>

namespace identpick {

namespace {

// Latin letters are decomposed and lose their combining marks (é -> e).
// Everything else is only composed, so kana with voicing marks and Hangul
// syllables stay whole.
std::u32string foldScripts(const std::u32string& text) {
    std::u32string out;
    out.reserve(text.size());
    for (char32_t c : text) {
        if (isLatinChar(c)) {
            for (char32_t d : normalizeNfkd(c)) {
                if (!isCombiningMark(d)) out.push_back(d);
            }
        } else {
            out += normalizeNfc(c);
        }
    }
    return out;
}

// Full titlecase mapping, unless it would introduce combining marks (ΐ maps
// to Ϊ plus an accent); then the one-to-one mapping is used instead.
std::string capitalizeFirst(char32_t c) {
    std::string full = toTitle(c);
    for (char32_t d : decodeUtf8(full)) {
        if (!isIdentChar(d)) return encodeUtf8(toTitleSimple(c));
    }
    return full;
}

} // namespace

std::string sanitizeIdent(const std::optional<std::string>& label,
                          const SanitizeOptions& options) {
    if (options.prefix.empty()) {
        throw std::invalid_argument("sanitizeIdent: prefix must not be empty");
    }
    const KeywordSet& keywords = options.keywords ? *options.keywords : KeywordSet::python();

    std::u32string ident = foldScripts(decodeUtf8(label.value_or(std::string())));

    // Each rejected character becomes its own underscore; runs are kept as-is.
    for (char32_t& c : ident) {
        if (!isIdentChar(c)) c = U'_';
    }

    ident.erase(0, ident.find_first_not_of(U'_'));

    if (!ident.empty() && (ident.front() == U'_' || isDecimalDigit(ident.front()))) {
        ident.insert(0, decodeUtf8(options.prefix));
    }
    if (ident.empty()) return {};

    std::string result;
    if (options.capitalize) {
        result = capitalizeFirst(ident.front()) + encodeUtf8(std::u32string_view(ident).substr(1));
    } else {
        result = encodeUtf8(ident);
    }

    while (keywords.isKeyword(result)) {
        LOG_DEBUG << "'" << result << "' is reserved, prefixing with '" << options.prefix << "'";
        result = options.prefix + result;
    }
    return result;
}

} // namespace identpick
