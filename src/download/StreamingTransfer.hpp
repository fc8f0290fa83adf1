#pragma once

#include "Cancellation.hpp"
#include "HttpStream.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace package
{
class ZipPackage;
}

namespace download
{

using ProgressCallback = std::function<void(int percent, const std::string& description)>;

struct TransferOptions
{
    std::size_t chunkSize = 4096;
    RequestOptions request;
    std::filesystem::path tempDirectory; // Empty = platform temp dir
};

// Copies a remote archive to a temporary file chunk by chunk, reporting progress after
// every chunk and observing the cancellation token during and after each read.
class StreamingTransfer
{
public:
    StreamingTransfer(HttpTransport& transport, TransferOptions options);

    // Returns the downloaded package, or nullptr when the server announced an empty body.
    // Throws TransferCancelled once the token is observed and TransferError for any I/O failure.
    // No progress is reported after the token has been observed.
    std::unique_ptr<package::ZipPackage> fetch(const std::string& locator, const ProgressCallback& onProgress,
                                               const CancellationToken& token);

    const TransferOptions& options() const { return options_; }

    // floor(done * 100 / total), 0 when total is unknown or zero
    static int percentOf(std::uint64_t done, std::optional<std::uint64_t> total);

    // "Downloaded 4KB of 10KB..." or "Downloaded 4KB..." when the total is unknown
    static std::string describeProgress(std::uint64_t done, std::optional<std::uint64_t> total);

    // Rounds up: 1 byte is 1KB
    static std::uint64_t toKB(std::uint64_t bytes) { return (bytes + 1023) / 1024; }

private:
    HttpTransport& transport_;
    TransferOptions options_;
};

} // namespace download
