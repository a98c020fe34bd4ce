#include <catch2/catch_test_macros.hpp>
#include "identpick/ident_set.h"
#include <set>
#include <vector>

using namespace identpick;

TEST_CASE("IdentSet lookup ignores case", "[ident_set]") {
    IdentSet s;
    s.insert("Name");
    CHECK(s.contains("Name"));
    CHECK(s.contains("NAME"));
    CHECK(s.contains("name"));
    CHECK_FALSE(s.contains("Names"));
}

TEST_CASE("IdentSet dedups across case", "[ident_set]") {
    IdentSet s{"a", "A", "b"};
    CHECK(s.size() == 2);
    CHECK(s.canonical().count("A") == 1);
    CHECK(s.canonical().count("a") == 0);
}

TEST_CASE("IdentSet uses full upper-casing", "[ident_set]") {
    IdentSet s{"straße"};
    CHECK(s.contains("STRASSE"));
    CHECK(s.contains("strasse"));
}

TEST_CASE("IdentSet from containers", "[ident_set]") {
    std::vector<std::string> names{"Table1", "people"};
    IdentSet fromVector(names);
    CHECK(fromVector.size() == 2);
    CHECK(fromVector.contains("TABLE1"));

    std::set<std::string> ordered{"x", "y"};
    IdentSet fromSet(ordered);
    CHECK(fromSet.contains("Y"));
}

TEST_CASE("IdentSet empty", "[ident_set]") {
    IdentSet s;
    CHECK(s.empty());
    CHECK_FALSE(s.contains(""));
}
