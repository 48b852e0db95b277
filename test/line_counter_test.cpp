#include <catch2/catch_test_macros.hpp>
#include "line_counter.hpp"

TEST_CASE("LineCounter skips blank lines", "[LineCounter]") {
    SECTION("Whitespace-only lines are blank") {
        const auto count = LineCounter::count("a\n\n  \n\tb  \n");
        REQUIRE(count.lines == 2);
        REQUIRE(count.chars == 5);  // "a" + "\tb  "
    }

    SECTION("Empty text") {
        const auto count = LineCounter::count("");
        REQUIRE(count.lines == 0);
        REQUIRE(count.chars == 0);
    }

    SECTION("No-break and ideographic spaces are blank") {
        REQUIRE(LineCounter::isBlank("\xC2\xA0\xE3\x80\x80 \t"));
        REQUIRE(LineCounter::count("\xC2\xA0\n\xE3\x80\x80\n").lines == 0);
        REQUIRE_FALSE(LineCounter::isBlank("\xC2\xA0x"));
    }

    SECTION("Characters are code points") {
        const auto count = LineCounter::count("h\xC3\xA9llo\n\xE4\xB8\xAD\xE6\x96\x87\n");
        REQUIRE(count.lines == 2);
        REQUIRE(count.chars == 7);
        REQUIRE(LineCounter::codePoints("\xF0\x9F\x98\x80") == 1);
    }
}
