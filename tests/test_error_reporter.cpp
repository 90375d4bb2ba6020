#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[error_reporter]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    SECTION("Reports keep their order and are drained once")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "first", "a = 1");
        ErrorReporter::ReportError(ErrorCategory::Initialization, "second");
        ErrorReporter::ReportError(ErrorCategory::Unknown, ErrorSeverity::Info, "third");

        REQUIRE(ErrorReporter::GetLastError().message == "third");

        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 3);
        REQUIRE(reports[0].message == "first");
        REQUIRE(reports[0].severity == ErrorSeverity::Warning);
        REQUIRE(reports[0].technical_details == "a = 1");
        REQUIRE(reports[1].severity == ErrorSeverity::Error);
        REQUIRE(reports[1].category == ErrorCategory::Initialization);
        REQUIRE(reports[2].severity == ErrorSeverity::Info);
        REQUIRE_FALSE(reports[2].timestamp.empty());

        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    }

    SECTION("The queue is bounded and drops the oldest reports")
    {
        for (int i = 0; i < 150; ++i)
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "report " + std::to_string(i));

        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 100);
        REQUIRE(reports.front().message == "report 50");
        REQUIRE(reports.back().message == "report 149");
    }

    SECTION("Last error without reports is a default report")
    {
        const ErrorReport last = ErrorReporter::GetLastError();
        REQUIRE(last.category == ErrorCategory::Unknown);
        REQUIRE(last.message.empty());
    }

    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - Formatting", "[error_reporter]")
{
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Configuration)) == "Configuration");
    REQUIRE(std::string(ErrorReporter::SeverityToString(ErrorSeverity::Warning)) == "Warning");

    const ErrorReport with_details(ErrorCategory::Configuration, ErrorSeverity::Warning,
                                   "Unknown scoring backend, using reference", "scoring.backend = fastest");
    REQUIRE(ErrorReporter::Format(with_details) ==
            "[Configuration] Unknown scoring backend, using reference (scoring.backend = fastest)");

    const ErrorReport bare(ErrorCategory::Initialization, ErrorSeverity::Error, "Logger failed", "");
    REQUIRE(ErrorReporter::Format(bare) == "[Initialization] Logger failed");

    const std::string stamp = ErrorReporter::GetTimestamp();
    REQUIRE(stamp.size() == 23);
    REQUIRE(stamp[10] == ' ');
    REQUIRE(stamp[19] == '.');
}
