#pragma once

#include "Cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace download
{

struct Header
{
    std::string name;
    std::string value;
};

// Body of an HTTP response whose headers have already been received
class ResponseStream
{
public:
    virtual ~ResponseStream() = default;

    virtual int statusCode() const = 0;

    // Value of Content-Length, std::nullopt when the server did not send one
    virtual std::optional<std::uint64_t> contentLength() const = 0;

    // Blocks until data is available, the body ends or the token is cancelled.
    // Returns the number of bytes copied into buffer; 0 means end of body or cancelled.
    // Throws TransferError on transport failure.
    virtual std::size_t read(char* buffer, std::size_t maxBytes, const CancellationToken& token) = 0;
};

struct RequestOptions
{
    std::string userAgent;
    std::vector<Header> headers;
    int connectTimeoutMs = 10000;
    int timeoutMs = 0; // 0 = no overall deadline
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // Issues a GET and returns once the response headers are read; the body is streamed.
    // Throws TransferError{Connection} when no response could be obtained and
    // TransferCancelled when the token fires before headers arrive.
    virtual std::unique_ptr<ResponseStream> open(const std::string& url, const RequestOptions& options,
                                                 const CancellationToken& token) = 0;
};

} // namespace download
