#include "ConsoleSurfaces.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <iomanip>
#include <ostream>

namespace app
{

ConsoleProgressSurface::ConsoleProgressSurface(std::ostream& out, bool quiet)
    : out_(out)
    , quiet_(quiet)
{
}

void ConsoleProgressSurface::show(const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (quiet_)
        return;
    out_ << text << '\n';
    out_.flush();
}

void ConsoleProgressSurface::reportProgress(int percent, const std::string& description)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (quiet_)
        return;
    out_ << "\r[" << std::setw(3) << percent << "%] " << description;
    if (cancelRequested_)
    {
        out_ << " (canceling download...)";
    }
    out_.flush();
    lineOpen_ = true;
}

bool ConsoleProgressSurface::isCancelRequested() const { return cancelRequested_.load(); }

void ConsoleProgressSurface::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (lineOpen_)
    {
        out_ << '\n';
        out_.flush();
        lineOpen_ = false;
    }
}

void ConsoleProgressSurface::requestCancel() noexcept { cancelRequested_.store(true); }

void ConsoleProgressSurface::resetCancel() noexcept { cancelRequested_.store(false); }

void ReporterErrorSink::show(const std::string& message, download::MessageLevel level, download::MessageTopic topic)
{
    using utils::ErrorReporter;
    using utils::ErrorSeverity;

    ErrorSeverity severity = ErrorSeverity::Error;
    if (level == download::MessageLevel::Information)
        severity = ErrorSeverity::Info;
    else if (level == download::MessageLevel::Warning)
        severity = ErrorSeverity::Warning;

    ErrorReporter::Report(categoryFor(topic), severity, message);
}

utils::ErrorCategory ReporterErrorSink::categoryFor(download::MessageTopic topic)
{
    switch (topic)
    {
    case download::MessageTopic::Session:
        return utils::ErrorCategory::Session;
    case download::MessageTopic::Storage:
        return utils::ErrorCategory::Filesystem;
    case download::MessageTopic::Package:
        return utils::ErrorCategory::Package;
    case download::MessageTopic::Network:
    default:
        return utils::ErrorCategory::Network;
    }
}

void ConsoleMainSurface::activate() { PLOG_DEBUG << "Main surface activated"; }

} // namespace app
