#include <catch2/catch_test_macros.hpp>
#include "fuzzscore/Diagnostics.hpp"

#include <string>

using fuzzscore::Diagnostics;

namespace
{

struct PreviewLimit
{
    explicit PreviewLimit(std::size_t bytes) : saved_(Diagnostics::MaxPreview()) { Diagnostics::SetMaxPreview(bytes); }
    ~PreviewLimit() { Diagnostics::SetMaxPreview(saved_); }

    std::size_t saved_;
};

} // namespace

TEST_CASE("Diagnostics - Preview", "[diagnostics]")
{
    PreviewLimit limit(8);

    SECTION("Short text is kept")
    {
        REQUIRE(Diagnostics::Preview("abc") == "abc");
        REQUIRE(Diagnostics::Preview("").empty());
    }

    SECTION("Line breaks, tabs and quotes are escaped")
    {
        REQUIRE(Diagnostics::Preview("a\nb\tc\"") == "a\\nb\\tc\\\"");
        REQUIRE(Diagnostics::Preview("x\r") == "x\\r");
    }

    SECTION("Other control characters are masked")
    {
        REQUIRE(Diagnostics::Preview(std::string("a\x01" "b\x7f", 4)) == "a?b?");
    }

    SECTION("Long text is cut and the full size reported")
    {
        REQUIRE(Diagnostics::Preview("0123456789") == "01234567... (10 bytes)");
    }

    SECTION("The cut never splits a UTF-8 sequence")
    {
        // 'é' is two bytes; the limit falls between them
        REQUIRE(Diagnostics::Preview("abcdefg\xc3\xa9xyz") == "abcdefg... (12 bytes)");
        // '東' is three bytes and ends exactly at the limit
        REQUIRE(Diagnostics::Preview("abcde\xe6\x9d\xb1xyz") == "abcde\xe6\x9d\xb1... (11 bytes)");
    }
}

TEST_CASE("Diagnostics - Settings", "[diagnostics]")
{
    SECTION("Preview limit is at least one byte")
    {
        PreviewLimit limit(0);
        REQUIRE(Diagnostics::MaxPreview() == 1);
    }

    SECTION("Verbose toggles")
    {
        const bool saved = Diagnostics::IsVerbose();
        Diagnostics::SetVerbose(true);
        REQUIRE(Diagnostics::IsVerbose());
        Diagnostics::SetVerbose(false);
        REQUIRE_FALSE(Diagnostics::IsVerbose());
        Diagnostics::SetVerbose(saved);
    }
}

TEST_CASE("Diagnostics - Trace passes the score through", "[diagnostics]")
{
    REQUIRE(Diagnostics::Trace("ratio", "abc", "abd", 67) == 67);
    REQUIRE(Diagnostics::Trace("WRatio", "", "", 0) == 0);
}
