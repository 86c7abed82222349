#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace turbofetch {

class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_relaxed);
        }
        cv_.notify_all();
    }

    void reset() { cancelled_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    // Sleeps for `duration` unless cancelled first. Returns true when cancelled.
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return isCancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace turbofetch
