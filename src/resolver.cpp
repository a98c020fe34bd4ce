#include "identpick/resolver.h"
#include "identpick/char_class.h"
#include "identpick/ident_set.h"
#include "identpick/log.h"
#include "identpick/unicode_util.h"
#include <stdexcept>

namespace identpick {

std::string addSuffix(std::string_view base, const IdentSet& avoid, uint64_t nextSuffix) {
    std::string stem(base);
    std::u32string chars = decodeUtf8(base);
    if (!chars.empty() && isDecimalDigit(chars.back())) {
        stem += '_';
    }

    while (true) {
        std::string ident = stem + std::to_string(nextSuffix);
        if (!avoid.contains(ident)) return ident;
        ++nextSuffix;
    }
}

std::string resolveUnique(std::string_view candidate, const IdentSet& avoid) {
    if (candidate.empty()) {
        throw std::invalid_argument("resolveUnique: empty candidate");
    }
    if (!avoid.contains(candidate)) return std::string(candidate);

    std::string ident = addSuffix(candidate, avoid, 2);
    LOG_DEBUG << "'" << candidate << "' is taken, using '" << ident << "'";
    return ident;
}

} // namespace identpick
