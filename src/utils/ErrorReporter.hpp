#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

// Where a problem surfaced, used to group messages shown at exit
enum class ErrorCategory
{
    Initialization, // Logging, command line
    Configuration,  // pkgdl.toml
    Session,        // Download rejected or aborted by the caller
    Network,        // Connect, HTTP status, body read
    Filesystem,     // Temp file, saving the package
    Package         // Downloaded archive cannot be opened
};

enum class ErrorSeverity
{
    Info,
    Warning,
    Error
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Session;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;
    std::string details;
    std::string timestamp;
};

/**
 * @brief Process-wide queue of user facing problems
 *
 * Every report is logged through plog as it arrives. The command line front end drains the
 * queue once the download has finished and prints what is left. At most kMaxPending reports
 * are kept; the oldest are dropped first.
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    // Removes and returns every queued report, oldest first
    static std::vector<ErrorReport> TakePending();

    // "Warning [Configuration]: message (details)"
    static std::string Describe(const ErrorReport& report);

    static const char* CategoryName(ErrorCategory category);
    static const char* SeverityName(ErrorSeverity severity);

    static constexpr std::size_t kMaxPending = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_pending;
};

} // namespace utils
