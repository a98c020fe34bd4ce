#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace identpick {

class IdentSet;

/// First of base+N, base+N+1, ... that is not in `avoid`, starting at
/// N = nextSuffix. A base ending in a digit gets '_' before the number, so
/// "col1" yields "col1_2" rather than "col12".
std::string addSuffix(std::string_view base, const IdentSet& avoid, uint64_t nextSuffix = 1);

/// `candidate` itself if free, otherwise addSuffix(candidate, avoid, 2).
/// `candidate` must be non-empty.
std::string resolveUnique(std::string_view candidate, const IdentSet& avoid);

} // namespace identpick
