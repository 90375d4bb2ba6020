#include <catch2/catch_test_macros.hpp>
#include "fuzzscore/Errors.hpp"
#include "fuzzscore/Preprocessor.hpp"

#include <limits>
#include <string>

using namespace fuzzscore;

TEST_CASE("Preprocessor - fullProcess", "[preprocessor]")
{
    SECTION("Punctuation becomes whitespace, runs collapse, ends are trimmed")
    {
        REQUIRE(fullProcess(U"  New York   Mets!! ", true) == U"new york mets");
        REQUIRE(fullProcess(U"this-is_a.test", true) == U"this is a test");
        REQUIRE(fullProcess(U"C++ / Rust", true) == U"c rust");
    }

    SECTION("Nothing alphanumeric leaves an empty string")
    {
        REQUIRE(fullProcess(U"!!! ??? ...", true).empty());
        REQUIRE(fullProcess(U"", false).empty());
    }

    SECTION("force_ascii drops non-ASCII code points")
    {
        REQUIRE(fullProcess(U"café olé", true) == U"caf ol");
        REQUIRE(fullProcess(U"Straße", true) == U"strae");
        REQUIRE(fullProcess(U"東京 タワー", true).empty());
    }

    SECTION("Without force_ascii Unicode is kept and lowercased")
    {
        REQUIRE(fullProcess(U"Café Olé", false) == U"café olé");
        REQUIRE(fullProcess(U"ÜNÏCÖDÉ", false) == U"ünïcödé");
        REQUIRE(fullProcess(U"東京、タワー", false) == U"東京 タワー");
    }

    SECTION("Idempotent")
    {
        const std::u32string once = fullProcess(U" The Quick, Brown  FOX ", true);
        REQUIRE(fullProcess(once, true) == once);
    }
}

TEST_CASE("Preprocessor - preprocess", "[preprocessor]")
{
    SECTION("full_process decodes and normalizes")
    {
        REQUIRE(preprocess("Hello, World!", true, true) == U"hello world");
    }

    SECTION("Without full_process the input passes through")
    {
        REQUIRE(preprocess("Hello, World!", true, false) == U"Hello, World!");
        REQUIRE(preprocess("  café ", true, false) == U"  café ");
    }

    SECTION("Malformed UTF-8 is rejected in both modes")
    {
        REQUIRE_THROWS_AS(preprocess(std::string("bad\xfe"), true, true), InvalidTextError);
        REQUIRE_THROWS_AS(preprocess(std::string("bad\xfe"), true, false), InvalidTextError);
    }

    SECTION("validateString")
    {
        REQUIRE(validateString(U"a"));
        REQUIRE_FALSE(validateString(U""));
    }
}

TEST_CASE("Preprocessor - toText coercion", "[preprocessor][coercion]")
{
    SECTION("Strings pass through")
    {
        REQUIRE(toText("abc") == "abc");
        REQUIRE(toText(std::string("abc")) == "abc");
        REQUIRE(toText(std::string_view("abc")) == "abc");
    }

    SECTION("Null C string fails loudly")
    {
        const char* missing = nullptr;
        REQUIRE_THROWS_AS(toText(missing), InvalidTextError);
    }

    SECTION("Booleans and integers")
    {
        REQUIRE(toText(true) == "True");
        REQUIRE(toText(false) == "False");
        REQUIRE(toText(42) == "42");
        REQUIRE(toText(-7L) == "-7");
        REQUIRE(toText(18446744073709551615ULL) == "18446744073709551615");
    }

    SECTION("Floating point uses the shortest round-trip form")
    {
        REQUIRE(toText(1.5) == "1.5");
        REQUIRE(toText(1.0) == "1.0");
        REQUIRE(toText(0.1) == "0.1");
        REQUIRE(toText(0.1f) == "0.1");
        REQUIRE(toText(std::numeric_limits<double>::infinity()) == "inf");
        REQUIRE(toText(-std::numeric_limits<double>::infinity()) == "-inf");
        REQUIRE(toText(std::numeric_limits<double>::quiet_NaN()) == "nan");
    }

    SECTION("Equal values coerce to equal text")
    {
        REQUIRE(toText(3.14) == toText(3.14));
        REQUIRE(toText(100) == toText(100));
        REQUIRE(toText(1) != toText(1.0));
    }
}
