#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <utility>

namespace utils
{

namespace
{

std::string nowStamp()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

plog::Severity toPlog(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
    default:
        return plog::error;
    }
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_pending;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    ErrorReport report{ category, severity, message, details, nowStamp() };

    PLOG(toPlog(severity)) << Describe(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.push_back(std::move(report));
    while (s_pending.size() > kMaxPending)
    {
        s_pending.pop_front();
    }
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

std::vector<ErrorReport> ErrorReporter::TakePending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_pending.begin()),
                                     std::make_move_iterator(s_pending.end()));
    s_pending.clear();
    return drained;
}

std::string ErrorReporter::Describe(const ErrorReport& report)
{
    std::string text = std::string(SeverityName(report.severity)) + " [" + CategoryName(report.category) +
                       "]: " + report.message;
    if (!report.details.empty())
    {
        text += " (" + report.details + ")";
    }
    return text;
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Session:
        return "Session";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Filesystem:
        return "Filesystem";
    case ErrorCategory::Package:
        return "Package";
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityName(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    }
    return "Unknown";
}

} // namespace utils
