#pragma once

#include "DownloadTypes.hpp"
#include "StreamingTransfer.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace package
{
class ZipPackage;
}

namespace download
{

class ProgressSurface;
class ErrorSink;
class MainSurface;
class HttpTransport;

struct DownloadOptions
{
    std::chrono::milliseconds pollInterval{ 200 };
    TransferOptions transfer;
};

// Runs one download at a time: shows the progress surface, polls it for a cancel request,
// drives the StreamingTransfer and always tears the UI down afterwards.
class DownloadController
{
public:
    DownloadController(ProgressSurface& progress, ErrorSink& errors, MainSurface& mainSurface,
                       HttpTransport& transport, DownloadOptions options = {});
    ~DownloadController();

    DownloadController(const DownloadController&) = delete;
    DownloadController& operator=(const DownloadController&) = delete;

    // Blocks until the download ends. Returns nullptr on cancellation or failure;
    // failures have already been shown through the ErrorSink.
    std::unique_ptr<package::ZipPackage> download(const DownloadRequest& request);

    std::unique_ptr<package::ZipPackage> download(const std::string& locator, const std::string& packageId = {},
                                                  const std::string& version = {});

    // Terminal status of the most recent download
    FetchStatus lastStatus() const;

    bool isDownloading() const;

    static std::string formatDisplayMessage(const DownloadRequest& request);

private:
    FetchOutcome run(const DownloadRequest& request);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace download
