#include "identpick/letter_sequence.h"
#include "identpick/ident_set.h"
#include "identpick/keywords.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace identpick {

static constexpr uint64_t kAlphabet = 26;

std::string letterLabel(uint64_t index) {
    // Bijective base 26: there is no zero digit, so each step borrows one.
    std::string out;
    uint64_t n = index;
    while (true) {
        out.push_back(static_cast<char>('A' + n % kAlphabet));
        if (n < kAlphabet) break;
        n = n / kAlphabet - 1;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<uint64_t> letterIndex(std::string_view label) {
    if (label.empty()) return std::nullopt;

    constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t n = 0;  // one-based while accumulating
    for (char c : label) {
        if (c < 'A' || c > 'Z') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - 'A') + 1;
        if (n > (max - digit) / kAlphabet) return std::nullopt;
        n = n * kAlphabet + digit;
    }
    return n - 1;
}

std::string LetterSequence::next() {
    if (index_ == std::numeric_limits<uint64_t>::max()) {
        throw std::overflow_error("LetterSequence exhausted");
    }
    return letterLabel(index_++);
}

std::string LetterSequence::peek() const {
    return letterLabel(index_);
}

std::string genIdent(const IdentSet& avoid, const KeywordSet* keywords) {
    const KeywordSet& reserved = keywords ? *keywords : KeywordSet::python();
    LetterSequence letters;
    while (true) {
        std::string label = letters.next();
        if (!avoid.contains(label) && !reserved.isKeyword(label)) return label;
    }
}

} // namespace identpick
