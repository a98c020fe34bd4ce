#pragma once

#include "ident_set.h"
#include "sanitize.h"
#include <optional>
#include <string>
#include <vector>

namespace identpick {

class KeywordSet;

struct PickerConfig {
    std::string tablePrefix = "T";
    std::string columnPrefix = "c";
    std::string tableFallbackBase = "Table";
    const KeywordSet* keywords = nullptr;  // nullptr means KeywordSet::python()
};

/// Picks table and column identifiers under one configuration. The free
/// functions below use a default-configured picker.
class IdentPicker {
public:
    IdentPicker();

    /// Throws std::invalid_argument if a prefix or the fallback base would not
    /// itself start a valid identifier.
    explicit IdentPicker(PickerConfig config);

    std::string pickTableIdent(const std::optional<std::string>& label,
                               const IdentSet& avoid) const;
    std::string pickColIdent(const std::optional<std::string>& label,
                             const IdentSet& avoid) const;

    /// Picks each label in order, treating earlier picks as taken.
    std::vector<std::string> pickColIdentList(const std::vector<std::optional<std::string>>& labels,
                                              const IdentSet& avoid) const;

    SanitizeOptions tableOptions() const;
    SanitizeOptions columnOptions() const;
    const PickerConfig& config() const { return config_; }

private:
    PickerConfig config_;
};

std::string pickTableIdent(const std::optional<std::string>& label, const IdentSet& avoid = {});
std::string pickColIdent(const std::optional<std::string>& label, const IdentSet& avoid = {});
std::vector<std::string> pickColIdentList(const std::vector<std::optional<std::string>>& labels,
                                          const IdentSet& avoid = {});

// Convenience overloads for a plain container of names in use.
template <typename Range>
std::string pickTableIdent(const std::optional<std::string>& label, const Range& avoid) {
    return pickTableIdent(label, IdentSet(avoid));
}

template <typename Range>
std::string pickColIdent(const std::optional<std::string>& label, const Range& avoid) {
    return pickColIdent(label, IdentSet(avoid));
}

template <typename Range>
std::vector<std::string> pickColIdentList(const std::vector<std::optional<std::string>>& labels,
                                          const Range& avoid) {
    return pickColIdentList(labels, IdentSet(avoid));
}

} // namespace identpick
