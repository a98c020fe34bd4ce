#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>

namespace identpick {

/// Reserved words an identifier may not spell. Matching ignores case, so
/// "CLASS" and "None" both count as keywords of a set containing "class" and
/// "None".
class KeywordSet {
public:
    KeywordSet() = default;
    KeywordSet(std::initializer_list<std::string_view> words);

    /// Python 3 hard keywords. Generated identifiers end up as names in
    /// Python formulas, so this is the default.
    static const KeywordSet& python();

    void add(std::string_view word);
    bool isKeyword(std::string_view ident) const;

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

private:
    std::unordered_set<std::string> words_;  // lower-cased
};

} // namespace identpick
