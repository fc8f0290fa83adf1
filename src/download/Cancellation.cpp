#include "Cancellation.hpp"

namespace download
{

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationSource::cancel() { flag_->store(true, std::memory_order_release); }

bool CancellationSource::isCancelled() const { return flag_->load(std::memory_order_acquire); }

CancellationToken CancellationSource::token() const { return CancellationToken(flag_); }

} // namespace download
