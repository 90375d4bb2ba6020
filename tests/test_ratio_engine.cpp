#include <catch2/catch_test_macros.hpp>
#include "fuzzscore/RatioEngine.hpp"

#include <string>

using namespace fuzzscore;

TEST_CASE("toScore - Rounds half to even", "[ratio][rounding]")
{
    REQUIRE(toScore(12.5) == 12);
    REQUIRE(toScore(13.5) == 14);
    REQUIRE(toScore(67.5) == 68);
    REQUIRE(toScore(0.5) == 0);
    REQUIRE(toScore(99.5) == 100);
    REQUIRE(toScore(12.4999) == 12);
    REQUIRE(toScore(12.5001) == 13);
    REQUIRE(toScore(0.0) == 0);
    REQUIRE(toScore(100.0) == 100);
}

TEST_CASE("RatioEngine - ratio", "[ratio]")
{
    RatioEngine engine;

    SECTION("Identical strings score 100")
    {
        REQUIRE(engine.ratio(U"this is a test", U"this is a test") == 100);
        REQUIRE(engine.ratio(U"主人公の冒険", U"主人公の冒険") == 100);
    }

    SECTION("Equivalence precedes the empty check")
    {
        REQUIRE(engine.ratio(U"", U"") == 100);
    }

    SECTION("One empty input scores 0")
    {
        REQUIRE(engine.ratio(U"", U"abc") == 0);
        REQUIRE(engine.ratio(U"abc", U"") == 0);
    }

    SECTION("Known scores")
    {
        REQUIRE(engine.ratio(U"this is a test", U"this is a test!") == 97);
        REQUIRE(engine.ratio(U"fuzzy wuzzy was a bear", U"wuzzy fuzzy was a bear") == 91);
        REQUIRE(engine.ratio(U"new york mets", U"new york mets vs atlanta braves") == 59);
        REQUIRE(engine.ratio(U"hello", U"world") == 20);
        REQUIRE(engine.ratio(U"abc", U"abd") == 67);
    }

    SECTION("Ratios exactly on .5 round to even")
    {
        // 2 * 1 / 16 = 0.125 -> 12.5
        REQUIRE(engine.ratio(U"abcdefgh", U"aijklmno") == 12);
        // 2 * 3 / 16 = 0.375 -> 37.5
        REQUIRE(engine.ratio(U"abcdefgh", U"abcxyzwv") == 38);
    }

    SECTION("Symmetric")
    {
        REQUIRE(engine.ratio(U"physics 101", U"physics 102") == 91);
        REQUIRE(engine.ratio(U"physics 102", U"physics 101") == 91);
    }

    SECTION("Order dependent when the longest match is ambiguous")
    {
        // The first longest match in a wins, so swapping the inputs can change the blocks
        REQUIRE(engine.ratio(U"tide", U"diet") == 25);
        REQUIRE(engine.ratio(U"diet", U"tide") == 50);
        REQUIRE(engine.ratio(U"atlanta falcons", U"new york jets") == 14);
        REQUIRE(engine.ratio(U"new york jets", U"atlanta falcons") == 29);
    }

    SECTION("Case sensitive without preprocessing")
    {
        REQUIRE(engine.ratio(U"The quick brown fox", U"the quick brown fox") == 95);
    }
}

TEST_CASE("RatioEngine - partialRatio", "[ratio][partial]")
{
    RatioEngine engine;

    SECTION("Substring scores 100 in either argument order")
    {
        REQUIRE(engine.partialRatio(U"this is a test", U"this is a test!") == 100);
        REQUIRE(engine.partialRatio(U"this is a test!", U"this is a test") == 100);
        REQUIRE(engine.partialRatio(U"yankees", U"new york yankees") == 100);
        REQUIRE(engine.partialRatio(U"test", U"this is a test of the emergency broadcast system") == 100);
    }

    SECTION("Best window anchored on a matching block")
    {
        // Window "xbcd" against "abcd"
        REQUIRE(engine.partialRatio(U"abcd", U"xxbcdee") == 75);
        REQUIRE(engine.partialRatio(U"xxbcdee", U"abcd") == 75);
    }

    SECTION("Equal lengths")
    {
        REQUIRE(engine.partialRatio(U"hello", U"world") == 22);
        REQUIRE(engine.partialRatio(U"physics 101", U"physics 102") == 91);
    }

    SECTION("Guards")
    {
        REQUIRE(engine.partialRatio(U"", U"") == 100);
        REQUIRE(engine.partialRatio(U"", U"abc") == 0);
        REQUIRE(engine.partialRatio(U"abc", U"") == 0);
    }

    SECTION("No shared symbol")
    {
        REQUIRE(engine.partialRatio(U"abc", U"xyzxyz") == 0);
    }
}

TEST_CASE("RatioEngine - Autojunk changes scores on repetitive input", "[ratio][autojunk]")
{
    std::u32string alternating;
    std::u32string shifted;
    for (int i = 0; i < 150; ++i)
    {
        alternating += U"ab";
        shifted += U"ba";
    }
    shifted += U"c";

    RatioEngine with_autojunk;
    RatioEngine without_autojunk(AlignerOptions{false});

    SECTION("Known divergence for ratio")
    {
        REQUIRE(with_autojunk.ratio(alternating, shifted) == 0);
        REQUIRE(without_autojunk.ratio(alternating, shifted) == 100);
    }

    SECTION("Partial windows recover the match either way")
    {
        REQUIRE(with_autojunk.partialRatio(alternating, shifted) == 100);
        REQUIRE(without_autojunk.partialRatio(alternating, shifted) == 100);
    }

    SECTION("Options are exposed")
    {
        REQUIRE(with_autojunk.options().autojunk);
        REQUIRE_FALSE(without_autojunk.options().autojunk);
    }
}
