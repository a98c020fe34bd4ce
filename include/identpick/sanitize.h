#pragma once

#include <optional>
#include <string>

namespace identpick {

class KeywordSet;

struct SanitizeOptions {
    std::string prefix = "c";              // inserted before a leading digit or keyword
    bool capitalize = false;               // title-case the first character only
    const KeywordSet* keywords = nullptr;  // nullptr means KeywordSet::python()
};

/// Massage an arbitrary label into an identifier candidate: Latin letters lose
/// their accents, other scripts are kept, every other character becomes '_',
/// leading underscores go, and `prefix` repairs a leading digit or a keyword.
///
/// Returns an empty string when nothing identifier-legal survives; callers
/// supply their own fallback in that case. Never throws for label content.
/// Throws std::invalid_argument if `options.prefix` is empty.
std::string sanitizeIdent(const std::optional<std::string>& label,
                          const SanitizeOptions& options = {});

} // namespace identpick
