#include <catch2/catch_test_macros.hpp>
#include "identpick/ident_set.h"
#include "identpick/resolver.h"
#include <stdexcept>

using namespace identpick;

TEST_CASE("addSuffix counts from the given start", "[resolver]") {
    CHECK(addSuffix("Table", {}, 1) == "Table1");
    CHECK(addSuffix("Table", {"TABLE1"}, 1) == "Table2");
    CHECK(addSuffix("Table", {"table1", "Table2", "TABLE3"}, 1) == "Table4");
    CHECK(addSuffix("Name", {}, 2) == "Name2");
}

TEST_CASE("addSuffix separates a trailing digit", "[resolver]") {
    CHECK(addSuffix("col1", {}, 2) == "col1_2");
    CHECK(addSuffix("col1", {"COL1_2"}, 2) == "col1_3");
    CHECK(addSuffix("x٣", {}, 2) == "x٣_2");
}

TEST_CASE("resolveUnique returns a free candidate unchanged", "[resolver]") {
    CHECK(resolveUnique("Name", {}) == "Name");
    CHECK(resolveUnique("col1", {}) == "col1");
    CHECK(resolveUnique("Name", {"Names", "Nam"}) == "Name");
}

TEST_CASE("resolveUnique suffixes a taken candidate from 2", "[resolver]") {
    CHECK(resolveUnique("Name", {"NAME"}) == "Name2");
    CHECK(resolveUnique("Name", {"name", "NAME2", "Name3"}) == "Name4");
    CHECK(resolveUnique("col1", {"COL1"}) == "col1_2");
    CHECK(resolveUnique("straße", {"STRASSE"}) == "straße2");
}

TEST_CASE("resolveUnique skips many collisions", "[resolver]") {
    IdentSet avoid{"A"};
    for (int i = 2; i < 100; i++) {
        avoid.insert("A" + std::to_string(i));
    }
    CHECK(resolveUnique("a", avoid) == "a100");
}

TEST_CASE("resolveUnique rejects an empty candidate", "[resolver]") {
    CHECK_THROWS_AS(resolveUnique("", {}), std::invalid_argument);
}
