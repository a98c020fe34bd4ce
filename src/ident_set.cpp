#include "identpick/ident_set.h"
#include "identpick/unicode_util.h"

namespace identpick {

IdentSet::IdentSet(std::initializer_list<std::string_view> idents) {
    for (auto ident : idents) insert(ident);
}

void IdentSet::insert(std::string_view ident) {
    upper_.insert(toUpper(ident));
}

bool IdentSet::contains(std::string_view ident) const {
    return upper_.count(toUpper(ident)) > 0;
}

} // namespace identpick
