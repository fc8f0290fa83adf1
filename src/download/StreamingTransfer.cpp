#include "StreamingTransfer.hpp"
#include "DownloadTypes.hpp"
#include "TempFile.hpp"
#include "package/ZipPackage.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <system_error>
#include <vector>

namespace download
{

StreamingTransfer::StreamingTransfer(HttpTransport& transport, TransferOptions options)
    : transport_(transport)
    , options_(std::move(options))
{
    if (options_.chunkSize == 0)
    {
        options_.chunkSize = 4096;
    }
}

int StreamingTransfer::percentOf(std::uint64_t done, std::optional<std::uint64_t> total)
{
    if (!total || *total == 0)
        return 0;
    return static_cast<int>(std::min<std::uint64_t>(done * 100 / *total, 100));
}

std::string StreamingTransfer::describeProgress(std::uint64_t done, std::optional<std::uint64_t> total)
{
    std::string text = "Downloaded " + std::to_string(toKB(done)) + "KB";
    if (total)
    {
        text += " of " + std::to_string(toKB(*total)) + "KB";
    }
    return text + "...";
}

std::unique_ptr<package::ZipPackage> StreamingTransfer::fetch(const std::string& locator,
                                                              const ProgressCallback& onProgress,
                                                              const CancellationToken& token)
{
    PLOG_INFO << "Starting transfer: " << locator;

    std::unique_ptr<ResponseStream> response;
    try
    {
        response = transport_.open(locator, options_.request, token);
    }
    catch (const TransferCancelled&)
    {
        throw;
    }
    catch (const TransferError&)
    {
        throw;
    }
    catch (const std::exception&)
    {
        std::throw_with_nested(TransferError(TransferErrorKind::Connection, "Failed to connect to " + locator));
    }

    if (token.isCancelled())
    {
        throw TransferCancelled();
    }

    const int status = response->statusCode();
    if (status < 200 || status >= 300)
    {
        PLOG_ERROR << "Download failed with status: " << status;
        throw TransferError(TransferErrorKind::HttpStatus, "HTTP error " + std::to_string(status));
    }

    const std::optional<std::uint64_t> total = response->contentLength();
    if (total && *total == 0)
    {
        PLOG_WARNING << "Server announced an empty body for " << locator << ", nothing to download";
        return nullptr;
    }
    if (!total)
    {
        PLOG_INFO << "No Content-Length for " << locator << ", streaming until end of body";
    }

    TempFile temp;
    try
    {
        temp = TempFile::create(options_.tempDirectory);
    }
    catch (const std::system_error&)
    {
        std::throw_with_nested(TransferError(TransferErrorKind::Write, "Failed to create temporary file"));
    }

    std::ofstream output(temp.path(), std::ios::binary | std::ios::trunc);
    if (!output.is_open())
    {
        throw TransferError(TransferErrorKind::Write, "Failed to open temporary file " + temp.path().string());
    }

    std::vector<char> buffer(options_.chunkSize);
    std::uint64_t readSoFar = 0;

    while (!total || readSoFar < *total)
    {
        std::size_t wanted = options_.chunkSize;
        if (total)
        {
            wanted = static_cast<std::size_t>(std::min<std::uint64_t>(wanted, *total - readSoFar));
        }

        std::size_t bytesRead = 0;
        try
        {
            bytesRead = response->read(buffer.data(), wanted, token);
        }
        catch (const TransferError&)
        {
            throw;
        }
        catch (const std::exception&)
        {
            std::throw_with_nested(TransferError(TransferErrorKind::Read, "Failed to read response body"));
        }

        if (token.isCancelled())
        {
            PLOG_INFO << "Transfer cancelled after " << readSoFar << " bytes";
            throw TransferCancelled();
        }

        if (bytesRead == 0)
        {
            if (total)
            {
                throw TransferError(TransferErrorKind::ShortTransfer,
                                    "Connection closed after " + std::to_string(readSoFar) + " of " +
                                        std::to_string(*total) + " bytes");
            }
            break;
        }

        output.write(buffer.data(), static_cast<std::streamsize>(bytesRead));
        if (!output)
        {
            throw TransferError(TransferErrorKind::Write, "Failed to write to " + temp.path().string());
        }
        readSoFar += bytesRead;

        PLOG_VERBOSE << "Received " << readSoFar << " bytes";
        if (onProgress)
        {
            onProgress(percentOf(readSoFar, total), describeProgress(readSoFar, total));
        }
    }

    output.close();
    if (output.fail())
    {
        throw TransferError(TransferErrorKind::Write, "Failed to flush " + temp.path().string());
    }

    // Connection is no longer needed once the body is on disk
    response.reset();

    PLOG_INFO << "Transfer completed: " << readSoFar << " bytes from " << locator;

    // A cancel raised by the last progress report or while flushing still wins
    if (token.isCancelled())
    {
        PLOG_INFO << "Transfer cancelled after the body was received";
        throw TransferCancelled();
    }

    std::unique_ptr<package::ZipPackage> handle;
    try
    {
        handle = package::ZipPackage::open(std::move(temp));
    }
    catch (const package::PackageError&)
    {
        std::throw_with_nested(TransferError(TransferErrorKind::Package, "Failed to open downloaded package"));
    }

    if (token.isCancelled())
    {
        PLOG_INFO << "Transfer cancelled while opening the package";
        throw TransferCancelled();
    }
    return handle;
}

} // namespace download
