#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace package
{
class ZipPackage;
}

namespace download
{

// A single download issued by the application
struct DownloadRequest
{
    std::string locator; // URI of the remote archive
    std::string packageId; // Optional, used for display only
    std::string version; // Optional version label, used for display only
};

// One progress update forwarded to the progress surface
struct ProgressReport
{
    int percent; // 0-100
    std::string description; // e.g., "Downloaded 4KB of 10KB..."

    ProgressReport()
        : percent(0)
    {
    }

    ProgressReport(int p, std::string desc)
        : percent(p)
        , description(std::move(desc))
    {
    }
};

// Terminal state of one download
enum class FetchStatus
{
    Success, // Package handle produced
    Cancelled, // User aborted, not an error
    Failed // Transfer error, reported through the error sink
};

struct FetchOutcome
{
    FetchStatus status;
    std::unique_ptr<package::ZipPackage> package; // Non-null only on Success
    std::string error; // Innermost cause message on Failed

    FetchOutcome();
    ~FetchOutcome();
    FetchOutcome(FetchOutcome&&) noexcept;
    FetchOutcome& operator=(FetchOutcome&&) noexcept;
};

enum class TransferErrorKind
{
    Connection, // Could not connect or transport failure
    HttpStatus, // Server answered with a non-2xx status
    Read, // Body read failed
    Write, // Temp file write failed
    ShortTransfer, // Body ended before Content-Length bytes arrived
    Package // Downloaded file is not a readable archive
};

const char* toString(TransferErrorKind kind);

// Raised by the transfer engine when the cancellation signal is observed
class TransferCancelled : public std::runtime_error
{
public:
    TransferCancelled()
        : std::runtime_error("Download cancelled")
    {
    }
};

// Any I/O failure during connect, header read, body read or disk write.
// The underlying cause, if any, is attached with std::throw_with_nested.
class TransferError : public std::runtime_error
{
public:
    TransferError(TransferErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    TransferErrorKind kind() const { return kind_; }

private:
    TransferErrorKind kind_;
};

// Message of the deepest nested exception, falling back to e.what()
std::string innermostMessage(const std::exception& e);

} // namespace download
