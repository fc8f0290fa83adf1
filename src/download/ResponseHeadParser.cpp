#include "ResponseHeadParser.hpp"

#include <plog/Log.h>

#include <cctype>
#include <limits>
#include <string>

namespace download
{

namespace
{

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

bool startsWithNoCase(std::string_view text, std::string_view prefix)
{
    if (text.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[i])));
        if (a != b)
            return false;
    }
    return true;
}

// "HTTP/1.1 200 OK", "HTTP/2 302"
int parseStatusLine(std::string_view line)
{
    auto space = line.find(' ');
    if (space == std::string_view::npos)
        return 0;
    std::string_view code = line.substr(space + 1, 3);
    if (code.size() != 3)
        return 0;
    int status = 0;
    for (char c : code)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return 0;
        status = status * 10 + (c - '0');
    }
    return status;
}

} // namespace

bool ResponseHeadParser::feed(std::string_view raw)
{
    std::string_view line = trim(raw);

    if (startsWithNoCase(line, "HTTP/"))
    {
        // Each hop (interim 1xx, redirect, final) starts a fresh block
        pending_ = ResponseHead{};
        pending_.statusCode = parseStatusLine(line);
        pendingHasLocation_ = false;
        return false;
    }

    if (line.empty())
    {
        if (complete_)
            return false;

        bool interim = pending_.statusCode < 200;
        bool redirect = pending_.statusCode >= 300 && pending_.statusCode < 400 && pendingHasLocation_;
        if (interim || redirect)
            return false;

        final_ = pending_;
        complete_ = true;
        return true;
    }

    if (startsWithNoCase(line, "content-length:"))
    {
        std::string_view value = line.substr(15);
        pending_.contentLength = parseContentLength(value);
        if (!pending_.contentLength)
        {
            PLOG_WARNING << "Ignoring malformed Content-Length '" << std::string(trim(value)) << "'";
        }
    }
    else if (startsWithNoCase(line, "location:"))
    {
        pendingHasLocation_ = true;
    }
    return false;
}

ResponseHead ResponseHeadParser::head() const { return complete_ ? final_ : pending_; }

std::optional<std::uint64_t> ResponseHeadParser::parseContentLength(std::string_view value)
{
    value = trim(value);
    if (value.empty())
        return std::nullopt;

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t result = 0;
    for (char c : value)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (result > (kMax - digit) / 10)
            return std::nullopt;
        result = result * 10 + digit;
    }
    return result;
}

} // namespace download
