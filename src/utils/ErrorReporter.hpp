#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logger registration, backend binding
    Configuration,  // TOML parsing, invalid settings
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Setting ignored or defaulted, library continues
    Error    // Operation failed, library continues with defaults
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;           // What went wrong, in plain words
    std::string technical_details; // Offending value, parser message, OS error
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details);
};

/**
 * @brief Thread-safe collector for configuration and initialization problems.
 *
 * Every report is logged through plog and queued so an embedding application can
 * surface it after calling config::ApplySettings().
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Unknown scoring backend, using reference",
 *                                "scoring.backend = fastest");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 *   }
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending reports and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Most recent pending report, or a default report when none is pending
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

    /// "[Category] message (details)", the form used in the log
    static std::string Format(const ErrorReport& report);

    /// Local time with milliseconds, "YYYY-MM-DD HH:MM:SS.mmm"
    static std::string GetTimestamp();

private:
    static void enqueue(ErrorReport report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
