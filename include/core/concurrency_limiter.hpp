#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Bounds the number of transformations running at once
 *
 * Callers that cannot get a slot within the queue wait are rejected with
 * ServiceBusy instead of piling up behind the running jobs.
 */
class ConcurrencyLimiter
{
public:
    class Slot
    {
    public:
        Slot(const Slot &) = delete;
        Slot &operator=(const Slot &) = delete;
        Slot(Slot &&other) noexcept;
        Slot &operator=(Slot &&) = delete;
        ~Slot();

    private:
        friend class ConcurrencyLimiter;
        explicit Slot(ConcurrencyLimiter *owner) : owner_(owner) {}

        ConcurrencyLimiter *owner_;
    };

    ConcurrencyLimiter(size_t max_concurrent, std::chrono::milliseconds queue_wait);

    /**
     * @brief Wait for a free slot
     * @return Slot released when it goes out of scope
     * @throws ServiceBusy if no slot frees up within the queue wait
     */
    Slot acquire();

    size_t active() const;
    size_t capacity() const { return max_concurrent_; }

private:
    void release() noexcept;

    const size_t max_concurrent_;
    const std::chrono::milliseconds queue_wait_;
    size_t active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};
