#include <catch2/catch_test_macros.hpp>
#include "identpick/ident_set.h"
#include "identpick/keywords.h"
#include "identpick/letter_sequence.h"

using namespace identpick;

TEST_CASE("letterLabel follows spreadsheet column naming", "[letters]") {
    CHECK(letterLabel(0) == "A");
    CHECK(letterLabel(1) == "B");
    CHECK(letterLabel(25) == "Z");
    CHECK(letterLabel(26) == "AA");
    CHECK(letterLabel(27) == "AB");
    CHECK(letterLabel(51) == "AZ");
    CHECK(letterLabel(52) == "BA");
    CHECK(letterLabel(701) == "ZZ");
    CHECK(letterLabel(702) == "AAA");
    CHECK(letterLabel(18277) == "ZZZ");
}

TEST_CASE("letterIndex inverts letterLabel", "[letters]") {
    CHECK(letterIndex("A") == 0u);
    CHECK(letterIndex("Z") == 25u);
    CHECK(letterIndex("AA") == 26u);
    CHECK(letterIndex("ZZ") == 701u);
    CHECK(letterIndex("AAA") == 702u);

    for (uint64_t i : {0u, 100u, 5000u, 123456u}) {
        CHECK(letterIndex(letterLabel(i)) == i);
    }
}

TEST_CASE("letterIndex rejects malformed labels", "[letters]") {
    CHECK_FALSE(letterIndex("").has_value());
    CHECK_FALSE(letterIndex("a").has_value());
    CHECK_FALSE(letterIndex("A1").has_value());
    CHECK_FALSE(letterIndex("A B").has_value());
    CHECK_FALSE(letterIndex(std::string(20, 'Z')).has_value());
}

TEST_CASE("LetterSequence walks lazily", "[letters]") {
    LetterSequence seq;
    CHECK(seq.peek() == "A");
    CHECK(seq.next() == "A");
    CHECK(seq.next() == "B");
    CHECK(seq.position() == 2u);

    for (int i = 2; i < 26; i++) seq.next();
    CHECK(seq.next() == "AA");
}

TEST_CASE("LetterSequence is restartable", "[letters]") {
    LetterSequence seq;
    seq.next();
    seq.next();
    seq.reset();
    CHECK(seq.next() == "A");

    LetterSequence fromMiddle(701);
    CHECK(fromMiddle.next() == "ZZ");
    CHECK(fromMiddle.next() == "AAA");
}

TEST_CASE("genIdent returns the first free label", "[letters]") {
    CHECK(genIdent({}) == "A");
    CHECK(genIdent({"a", "B"}) == "C");
    CHECK(genIdent({"B"}) == "A");
}

TEST_CASE("genIdent moves to two letters when singles are taken", "[letters]") {
    IdentSet avoid;
    for (uint64_t i = 0; i < 26; i++) avoid.insert(letterLabel(i));
    CHECK(genIdent(avoid) == "AA");
    CHECK(genIdent(avoid) == "AA");
}

TEST_CASE("genIdent skips reserved words", "[letters]") {
    IdentSet avoid;
    for (uint64_t i = 0; i < 44; i++) avoid.insert(letterLabel(i));  // A .. AR
    CHECK(genIdent(avoid) == "AT");  // AS is reserved

    KeywordSet none;
    CHECK(genIdent(avoid, &none) == "AS");
}
