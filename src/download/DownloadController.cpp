#include "DownloadController.hpp"
#include "ProgressSurface.hpp"
#include "package/ZipPackage.hpp"

#include <plog/Log.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace download
{

namespace
{

// Watches the progress surface for a cancel request on its own thread
class CancelPoller
{
public:
    CancelPoller(const ProgressSurface& surface, CancellationSource source, std::chrono::milliseconds interval)
        : surface_(surface)
        , source_(std::move(source))
        , interval_(interval)
    {
        thread_ = std::thread([this]() { loop(); });
    }

    ~CancelPoller() { stop(); }

    CancelPoller(const CancelPoller&) = delete;
    CancelPoller& operator=(const CancelPoller&) = delete;

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

private:
    void loop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopped_)
        {
            if (cv_.wait_for(lock, interval_, [this]() { return stopped_; }))
                break;

            lock.unlock();
            bool requested = surface_.isCancelRequested();
            lock.lock();

            if (requested)
            {
                PLOG_INFO << "Cancel requested, cancelling download...";
                stopped_ = true;
                source_.cancel();
            }
        }
    }

    const ProgressSurface& surface_;
    CancellationSource source_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread thread_;
};

// UI teardown steps must all run even if one of them throws
template <typename Step>
void guarded(const char* what, Step&& step)
{
    try
    {
        step();
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "Failed to " << what << ": " << e.what();
    }
}

MessageTopic topicFor(TransferErrorKind kind)
{
    switch (kind)
    {
    case TransferErrorKind::Write:
        return MessageTopic::Storage;
    case TransferErrorKind::Package:
        return MessageTopic::Package;
    case TransferErrorKind::Connection:
    case TransferErrorKind::HttpStatus:
    case TransferErrorKind::Read:
    case TransferErrorKind::ShortTransfer:
    default:
        return MessageTopic::Network;
    }
}

// Clears the busy flag however the session ends
class ActiveSession
{
public:
    explicit ActiveSession(std::atomic<bool>& flag)
        : flag_(flag)
    {
    }
    ~ActiveSession() { flag_ = false; }

    ActiveSession(const ActiveSession&) = delete;
    ActiveSession& operator=(const ActiveSession&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

struct DownloadController::Impl
{
    ProgressSurface& progress;
    ErrorSink& errors;
    MainSurface& mainSurface;
    HttpTransport& transport;
    DownloadOptions options;

    std::atomic<bool> downloading{ false };
    std::atomic<FetchStatus> lastStatus{ FetchStatus::Success };

    Impl(ProgressSurface& p, ErrorSink& e, MainSurface& m, HttpTransport& t, DownloadOptions o)
        : progress(p)
        , errors(e)
        , mainSurface(m)
        , transport(t)
        , options(std::move(o))
    {
    }
};

DownloadController::DownloadController(ProgressSurface& progress, ErrorSink& errors, MainSurface& mainSurface,
                                       HttpTransport& transport, DownloadOptions options)
    : impl_(std::make_unique<Impl>(progress, errors, mainSurface, transport, std::move(options)))
{
}

DownloadController::~DownloadController() = default;

std::string DownloadController::formatDisplayMessage(const DownloadRequest& request)
{
    std::string subject;
    if (!request.packageId.empty())
    {
        subject = request.packageId;
        if (!request.version.empty())
        {
            subject += " " + request.version;
        }
    }
    else
    {
        subject = request.locator;
    }
    return "Downloading package " + subject + "...";
}

std::unique_ptr<package::ZipPackage> DownloadController::download(const std::string& locator,
                                                                  const std::string& packageId,
                                                                  const std::string& version)
{
    return download(DownloadRequest{ locator, packageId, version });
}

std::unique_ptr<package::ZipPackage> DownloadController::download(const DownloadRequest& request)
{
    bool expected = false;
    if (!impl_->downloading.compare_exchange_strong(expected, true))
    {
        PLOG_WARNING << "Download already in progress";
        impl_->errors.show("Download already in progress", MessageLevel::Error, MessageTopic::Session);
        return nullptr;
    }
    ActiveSession session(impl_->downloading);

    // Stays Failed if a surface throws something run() does not handle
    impl_->lastStatus = FetchStatus::Failed;
    FetchOutcome outcome = run(request);

    impl_->lastStatus = outcome.status;
    return std::move(outcome.package);
}

FetchOutcome DownloadController::run(const DownloadRequest& request)
{
    const std::string message = formatDisplayMessage(request);
    PLOG_INFO << message << " (" << request.locator << ")";

    auto teardown = [this]()
    {
        guarded("close progress surface", [&]() { impl_->progress.close(); });
        guarded("activate main surface", [&]() { impl_->mainSurface.activate(); });
    };

    FetchOutcome outcome;
    MessageTopic topic = MessageTopic::Network;
    try
    {
        impl_->progress.show(message);

        CancellationSource cancellation;
        CancelPoller poller(impl_->progress, cancellation, impl_->options.pollInterval);

        StreamingTransfer transfer(impl_->transport, impl_->options.transfer);
        outcome.package = transfer.fetch(
            request.locator,
            [this](int percent, const std::string& description)
            { impl_->progress.reportProgress(percent, description); },
            cancellation.token());

        if (outcome.package)
        {
            outcome.status = FetchStatus::Success;
        }
        else
        {
            outcome.status = FetchStatus::Failed;
            outcome.error = "The server returned an empty response for " + request.locator;
        }
    }
    catch (const TransferCancelled&)
    {
        PLOG_INFO << "Download cancelled: " << request.locator;
        outcome.status = FetchStatus::Cancelled;
    }
    catch (const TransferError& e)
    {
        outcome.status = FetchStatus::Failed;
        outcome.error = innermostMessage(e);
        topic = topicFor(e.kind());
        PLOG_ERROR << "Download failed (" << toString(e.kind()) << "): " << e.what() << " (cause: " << outcome.error
                   << ")";
    }
    catch (const std::exception& e)
    {
        outcome.status = FetchStatus::Failed;
        outcome.error = innermostMessage(e);
        topic = MessageTopic::Session;
        PLOG_ERROR << "Download failed: " << e.what() << " (cause: " << outcome.error << ")";
    }
    catch (...)
    {
        PLOG_ERROR << "Download of " << request.locator << " aborted by a non-standard exception";
        teardown();
        throw;
    }

    if (outcome.status == FetchStatus::Failed)
    {
        guarded("show error", [&]() { impl_->errors.show(outcome.error, MessageLevel::Error, topic); });
    }

    teardown();

    if (outcome.status == FetchStatus::Success)
    {
        PLOG_INFO << "Package downloaded: " << outcome.package->path().string();
    }
    return outcome;
}

FetchStatus DownloadController::lastStatus() const { return impl_->lastStatus.load(); }

bool DownloadController::isDownloading() const { return impl_->downloading.load(); }

} // namespace download
