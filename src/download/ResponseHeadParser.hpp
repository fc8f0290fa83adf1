#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace download
{

// Status and length of the response whose body will follow
struct ResponseHead
{
    int statusCode = 0;
    std::optional<std::uint64_t> contentLength;
};

// Consumes raw header lines as libcurl delivers them, including the blocks of interim 1xx
// responses and followed redirects. Only the block that precedes the body is kept.
class ResponseHeadParser
{
public:
    // Returns true once the final header block has been completed by this line
    bool feed(std::string_view line);

    bool complete() const { return complete_; }

    // Final head, or the block seen so far if the body started without a terminating blank line
    ResponseHead head() const;

    // Strict decimal parse; rejects signs, blanks inside the number and overflow
    static std::optional<std::uint64_t> parseContentLength(std::string_view value);

private:
    ResponseHead pending_;
    bool pendingHasLocation_ = false;

    ResponseHead final_;
    bool complete_ = false;
};

} // namespace download
