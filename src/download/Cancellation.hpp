#pragma once

#include <atomic>
#include <memory>

namespace download
{

// Read side of a cancellation signal. Cheap to copy, safe to poll from any thread.
// A default-constructed token is never cancelled.
class CancellationToken
{
public:
    CancellationToken() = default;

    bool isCancelled() const { return flag_ && flag_->load(std::memory_order_acquire); }

    // Raw flag for APIs that take a cancel pointer (nullptr when never cancellable)
    const std::atomic<bool>* flag() const { return flag_.get(); }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag))
    {
    }

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Owner side of a cancellation signal, created unset
class CancellationSource
{
public:
    CancellationSource();

    void cancel();
    bool isCancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace download
