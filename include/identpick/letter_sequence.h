#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace identpick {

class IdentSet;
class KeywordSet;

/// Spreadsheet-style column label for a zero-based index:
/// 0 -> "A", 25 -> "Z", 26 -> "AA", 701 -> "ZZ", 702 -> "AAA".
std::string letterLabel(uint64_t index);

/// Inverse of letterLabel. Returns nullopt unless `label` is a non-empty run
/// of 'A'-'Z' whose index fits in 64 bits.
std::optional<uint64_t> letterIndex(std::string_view label);

/// Lazy, restartable walk over A, B, ..., Z, AA, AB, ...
class LetterSequence {
public:
    LetterSequence() = default;
    explicit LetterSequence(uint64_t start) : index_(start) {}

    std::string next();
    std::string peek() const;
    void reset() { index_ = 0; }
    uint64_t position() const { return index_; }

private:
    uint64_t index_ = 0;
};

/// First letter label that is neither in `avoid` nor a keyword ("AS", "IF",
/// "IN", "IS" and "OR" are skipped with the default Python set). Same avoid
/// set, same answer.
std::string genIdent(const IdentSet& avoid, const KeywordSet* keywords = nullptr);

} // namespace identpick
