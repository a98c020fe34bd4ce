#include "identpick/keywords.h"
#include "identpick/unicode_util.h"

namespace identpick {

KeywordSet::KeywordSet(std::initializer_list<std::string_view> words) {
    for (auto word : words) add(word);
}

const KeywordSet& KeywordSet::python() {
    static const KeywordSet keywords{
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield",
    };
    return keywords;
}

void KeywordSet::add(std::string_view word) {
    words_.insert(toLower(word));
}

bool KeywordSet::isKeyword(std::string_view ident) const {
    return words_.count(toLower(ident)) > 0;
}

} // namespace identpick
