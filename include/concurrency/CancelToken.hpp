#pragma once

#include "runtime/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sm::concurrency {

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::scoped_lock lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

    void throwIfCancelled() const {
        if (isCancelled()) throw runtime::Cancelled("Cancelled by user");
    }

    // Sleeps for up to `timeout`. Returns true if cancellation arrived first.
    bool waitFor(const std::chrono::milliseconds timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

}
