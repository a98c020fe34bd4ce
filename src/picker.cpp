#include "identpick/picker.h"
#include "identpick/char_class.h"
#include "identpick/keywords.h"
#include "identpick/letter_sequence.h"
#include "identpick/log.h"
#include "identpick/resolver.h"
#include "identpick/unicode_util.h"
#include <stdexcept>
#include <utility>

namespace identpick {

namespace {

bool isCleanIdentifier(const std::string& text) {
    std::u32string chars = decodeUtf8(text);
    if (chars.empty() || chars.front() == U'_' || isDecimalDigit(chars.front())) {
        return false;
    }
    for (char32_t c : chars) {
        if (!isIdentChar(c)) return false;
    }
    return true;
}

void checkConfig(const PickerConfig& config) {
    if (!isCleanIdentifier(config.tablePrefix)) {
        throw std::invalid_argument("IdentPicker: invalid table prefix '" + config.tablePrefix + "'");
    }
    if (!isCleanIdentifier(config.columnPrefix)) {
        throw std::invalid_argument("IdentPicker: invalid column prefix '" + config.columnPrefix + "'");
    }
    if (!isCleanIdentifier(config.tableFallbackBase)) {
        throw std::invalid_argument("IdentPicker: invalid table fallback '" +
                                    config.tableFallbackBase + "'");
    }
}

const IdentPicker& defaultPicker() {
    static const IdentPicker picker;
    return picker;
}

} // namespace

IdentPicker::IdentPicker() : IdentPicker(PickerConfig{}) {}

IdentPicker::IdentPicker(PickerConfig config) : config_(std::move(config)) {
    checkConfig(config_);
}

SanitizeOptions IdentPicker::tableOptions() const {
    return {config_.tablePrefix, true, config_.keywords};
}

SanitizeOptions IdentPicker::columnOptions() const {
    return {config_.columnPrefix, false, config_.keywords};
}

std::string IdentPicker::pickTableIdent(const std::optional<std::string>& label,
                                        const IdentSet& avoid) const {
    std::string ident = sanitizeIdent(label, tableOptions());
    if (ident.empty()) {
        ident = addSuffix(config_.tableFallbackBase, avoid, 1);
        LOG_DEBUG << "no usable characters in table label, using '" << ident << "'";
        return ident;
    }
    return resolveUnique(ident, avoid);
}

std::string IdentPicker::pickColIdent(const std::optional<std::string>& label,
                                      const IdentSet& avoid) const {
    std::string ident = sanitizeIdent(label, columnOptions());
    if (ident.empty()) {
        ident = genIdent(avoid, config_.keywords);
        LOG_DEBUG << "no usable characters in column label, using '" << ident << "'";
        return ident;
    }
    return resolveUnique(ident, avoid);
}

std::vector<std::string> IdentPicker::pickColIdentList(
        const std::vector<std::optional<std::string>>& labels, const IdentSet& avoid) const {
    // Later picks must see earlier ones, so this stays strictly sequential.
    IdentSet taken(avoid);
    std::vector<std::string> result;
    result.reserve(labels.size());
    for (const auto& label : labels) {
        std::string ident = pickColIdent(label, taken);
        taken.insert(ident);
        result.push_back(std::move(ident));
    }
    return result;
}

std::string pickTableIdent(const std::optional<std::string>& label, const IdentSet& avoid) {
    return defaultPicker().pickTableIdent(label, avoid);
}

std::string pickColIdent(const std::optional<std::string>& label, const IdentSet& avoid) {
    return defaultPicker().pickColIdent(label, avoid);
}

std::vector<std::string> pickColIdentList(const std::vector<std::optional<std::string>>& labels,
                                          const IdentSet& avoid) {
    return defaultPicker().pickColIdentList(labels, avoid);
}

} // namespace identpick
