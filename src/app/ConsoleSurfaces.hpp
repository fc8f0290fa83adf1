#pragma once

#include "download/ProgressSurface.hpp"
#include "utils/ErrorReporter.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

namespace app
{

// Headless progress surface: renders progress lines on a terminal stream.
// requestCancel() is async-signal-safe so it can be driven from a SIGINT handler.
class ConsoleProgressSurface : public download::ProgressSurface
{
public:
    ConsoleProgressSurface(std::ostream& out, bool quiet);

    void show(const std::string& text) override;
    void reportProgress(int percent, const std::string& description) override;
    bool isCancelRequested() const override;
    void close() override;

    void requestCancel() noexcept;
    void resetCancel() noexcept;

private:
    std::ostream& out_;
    bool quiet_;
    bool lineOpen_ = false;
    std::mutex mutex_;
    std::atomic<bool> cancelRequested_{ false };
};

// Forwards user-facing messages to utils::ErrorReporter
class ReporterErrorSink : public download::ErrorSink
{
public:
    void show(const std::string& message, download::MessageLevel level, download::MessageTopic topic) override;

    static utils::ErrorCategory categoryFor(download::MessageTopic topic);
};

class ConsoleMainSurface : public download::MainSurface
{
public:
    void activate() override;
};

} // namespace app
