#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Cooperative cancellation flag shared between a job and its owners
 *
 * A job is cancelled either explicitly through cancel() (shutdown) or when
 * the optional disconnect check reports true (client connection closed). Long running
 * steps poll isCancelled() and abort their work when it flips.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> disconnected) : disconnected_(std::move(disconnected)) {}

    void cancel(const std::string &reason)
    {
        markCancelled(reason);
    }

    bool isCancelled() const
    {
        if (cancelled_.load())
            return true;
        if (disconnected_ && disconnected_())
        {
            markCancelled("client disconnected");
            return true;
        }
        return false;
    }

    std::string reason() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

private:
    // First reason wins
    void markCancelled(const std::string &reason) const
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reason_.empty())
                reason_ = reason;
        }
        cancelled_.store(true);
    }

    std::function<bool()> disconnected_;
    mutable std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::string reason_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
