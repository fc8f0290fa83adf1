#include "CprTransport.hpp"
#include "DownloadTypes.hpp"
#include "ResponseHeadParser.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace download
{

namespace
{

constexpr std::size_t kMaxBufferedBytes = 256 * 1024;
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

[[noreturn]] void throwWithCause(TransferErrorKind kind, const std::string& message, const std::string& cause)
{
    try
    {
        throw std::runtime_error(cause);
    }
    catch (const std::runtime_error&)
    {
        std::throw_with_nested(TransferError(kind, message));
    }
}

class CprResponseStream final : public ResponseStream
{
public:
    CprResponseStream(const std::string& url, const RequestOptions& options)
        : url_(url)
    {
        worker_ = std::thread([this, options]() { run(options); });
    }

    ~CprResponseStream() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    // Returns false if the token fired before the final header block arrived
    bool waitForHeaders(const CancellationToken& token)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!headersReady_ && !finished_)
        {
            if (token.isCancelled())
            {
                closing_ = true;
                cv_.notify_all();
                return false;
            }
            cv_.wait_for(lock, kWaitSlice);
        }
        return true;
    }

    void throwIfNoResponse()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (headersReady_)
            return;
        throwWithCause(TransferErrorKind::Connection, "Failed to connect to " + url_,
                       transportError_.empty() ? std::string("No response received") : transportError_);
    }

    int statusCode() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return statusCode_;
    }

    std::optional<std::uint64_t> contentLength() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return contentLength_;
    }

    std::size_t read(char* buffer, std::size_t maxBytes, const CancellationToken& token) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (buffer_.empty() && !finished_)
        {
            if (token.isCancelled())
            {
                closing_ = true;
                cv_.notify_all();
                return 0;
            }
            cv_.wait_for(lock, kWaitSlice);
        }

        if (buffer_.empty())
        {
            if (!transportError_.empty())
            {
                std::string cause = transportError_;
                lock.unlock();
                throwWithCause(TransferErrorKind::Read, "Failed to read response body from " + url_, cause);
            }
            return 0;
        }

        std::size_t count = std::min(maxBytes, buffer_.size());
        std::copy_n(buffer_.begin(), count, buffer);
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        cv_.notify_all();
        return count;
    }

private:
    void run(const RequestOptions& options)
    {
        try
        {
            cpr::Session session;
            session.SetUrl(cpr::Url{ url_ });
            session.SetUserAgent(cpr::UserAgent{ options.userAgent });
            // Body bytes must match Content-Length, so no transparent decoding
            session.SetAcceptEncoding(cpr::AcceptEncoding{ { cpr::AcceptEncodingMethods::disabled } });
            if (!options.headers.empty())
            {
                cpr::Header header;
                for (const auto& h : options.headers)
                {
                    header.emplace(h.name, h.value);
                }
                session.SetHeader(header);
            }
            session.SetConnectTimeout(cpr::ConnectTimeout{ options.connectTimeoutMs });
            if (options.timeoutMs > 0)
            {
                session.SetTimeout(cpr::Timeout{ options.timeoutMs });
            }

            session.SetHeaderCallback(
                cpr::HeaderCallback{ [this](std::string_view line, intptr_t) -> bool { return onHeaderLine(line); } });
            session.SetWriteCallback(
                cpr::WriteCallback{ [this](std::string_view data, intptr_t) -> bool { return onBody(data); } });
            session.SetProgressCallback(cpr::ProgressCallback{
                [this](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t) -> bool
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    return !closing_;
                } });

            cpr::Response response = session.Get();

            std::lock_guard<std::mutex> lock(mutex_);
            if (response.error && !closing_)
            {
                transportError_ = response.error.message;
                PLOG_WARNING << "Transfer from " << url_ << " ended with error: " << transportError_;
            }
            if (!headersReady_ && !response.error && response.status_code != 0)
            {
                statusCode_ = static_cast<int>(response.status_code);
                headersReady_ = true;
            }
            finished_ = true;
        }
        catch (const std::exception& e)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transportError_ = e.what();
            finished_ = true;
            PLOG_ERROR << "HTTP worker failed for " << url_ << ": " << e.what();
        }
        cv_.notify_all();
    }

    bool onHeaderLine(std::string_view raw)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_)
            return false;

        if (headParser_.feed(raw) && !headersReady_)
        {
            publishHead();
        }
        return true;
    }

    // Caller holds mutex_
    void publishHead()
    {
        ResponseHead head = headParser_.head();
        statusCode_ = head.statusCode;
        contentLength_ = head.contentLength;
        headersReady_ = true;
        PLOG_DEBUG << "Response headers for " << url_ << ": status " << statusCode_ << ", length "
                   << (contentLength_ ? std::to_string(*contentLength_) : std::string("unknown"));
        cv_.notify_all();
    }

    bool onBody(std::string_view data)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!headersReady_)
        {
            publishHead();
        }

        cv_.wait(lock, [this]() { return closing_ || buffer_.size() < kMaxBufferedBytes; });
        if (closing_)
            return false;

        buffer_.insert(buffer_.end(), data.begin(), data.end());
        cv_.notify_all();
        return true;
    }

    std::string url_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<char> buffer_;

    ResponseHeadParser headParser_;

    int statusCode_ = 0;
    std::optional<std::uint64_t> contentLength_;
    bool headersReady_ = false;
    bool finished_ = false;
    bool closing_ = false;
    std::string transportError_;

    std::thread worker_;
};

} // namespace

std::unique_ptr<ResponseStream> CprTransport::open(const std::string& url, const RequestOptions& options,
                                                   const CancellationToken& token)
{
    if (token.isCancelled())
    {
        throw TransferCancelled();
    }

    PLOG_INFO << "GET " << url;

    auto stream = std::make_unique<CprResponseStream>(url, options);
    if (!stream->waitForHeaders(token))
    {
        throw TransferCancelled();
    }
    stream->throwIfNoResponse();
    return stream;
}

} // namespace download
