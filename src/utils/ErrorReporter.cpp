#include "ErrorReporter.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , message(std::move(msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, message, technical_details);

    const plog::Severity level = severity == ErrorSeverity::Error     ? plog::error
                                 : severity == ErrorSeverity::Warning ? plog::warning
                                                                      : plog::info;
    PLOG(level) << Format(report);

    enqueue(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, message, technical_details);
}

void ErrorReporter::enqueue(ErrorReport report)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    // Oldest reports are dropped once the queue is full
    if (s_error_queue.size() == MAX_QUEUE_SIZE)
        s_error_queue.erase(s_error_queue.begin());
    s_error_queue.push_back(std::move(report));
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::vector<ErrorReport> pending;
    std::lock_guard<std::mutex> lock(s_mutex);
    pending.swap(s_error_queue);
    return pending;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_queue.empty() ? ErrorReport() : s_error_queue.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    default:
        return "Unknown";
    }
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string line = "[";
    line += CategoryToString(report.category);
    line += "] ";
    line += report.message;
    if (!report.technical_details.empty())
    {
        line += " (";
        line += report.technical_details;
        line += ")";
    }
    return line;
}

std::string ErrorReporter::GetTimestamp()
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", date, static_cast<int>(millis));
    return stamp;
}

} // namespace utils
