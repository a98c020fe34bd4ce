#pragma once

#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace identpick {

/// Case-insensitive set of identifiers already in use. Members are stored
/// upper-cased and every lookup is upper-cased the same way, so callers never
/// fold case themselves.
class IdentSet {
public:
    IdentSet() = default;
    IdentSet(std::initializer_list<std::string_view> idents);

    /// Build from any range of string-like values (vector, set, ...).
    template <typename Range,
              typename = decltype(std::begin(std::declval<const Range&>())),
              typename = std::enable_if_t<!std::is_convertible_v<const Range&, std::string_view>>>
    explicit IdentSet(const Range& idents) {
        for (const auto& ident : idents) insert(ident);
    }

    void insert(std::string_view ident);
    bool contains(std::string_view ident) const;

    size_t size() const { return upper_.size(); }
    bool empty() const { return upper_.empty(); }

    /// Upper-cased members, for callers that persist the evolving set.
    const std::unordered_set<std::string>& canonical() const { return upper_; }

private:
    std::unordered_set<std::string> upper_;
};

} // namespace identpick
