#include "core/concurrency_limiter.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>

ConcurrencyLimiter::Slot::Slot(Slot &&other) noexcept : owner_(other.owner_)
{
    other.owner_ = nullptr;
}

ConcurrencyLimiter::Slot::~Slot()
{
    if (owner_)
    {
        owner_->release();
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(size_t max_concurrent, std::chrono::milliseconds queue_wait)
    : max_concurrent_(std::max<size_t>(1, max_concurrent)), queue_wait_(queue_wait)
{
}

ConcurrencyLimiter::Slot ConcurrencyLimiter::acquire()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, queue_wait_, [this]
                      { return active_ < max_concurrent_; }))
    {
        Logger::warn("ConcurrencyLimiter: all " + std::to_string(max_concurrent_) + " slots busy after " +
                     std::to_string(queue_wait_.count()) + "ms");
        throw ServiceBusy("Server is busy, try again later");
    }
    ++active_;
    return Slot(this);
}

void ConcurrencyLimiter::release() noexcept
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0)
            --active_;
    }
    cv_.notify_one();
}

size_t ConcurrencyLimiter::active() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}
