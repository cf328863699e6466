#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace scingest::upload {

/**
 * @brief Cooperative stop flag shared between a job and its transfer workers
 *
 * Workers poll cancelled() between attempts; backoff sleeps use wait_for()
 * so a cancel wakes them immediately.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    // Re-arm before a paused transfer is restarted.
    void reset() {
        std::lock_guard lock(mutex_);
        cancelled_.store(false);
    }

    /**
     * @brief Sleep up to `timeout`; returns true if cancelled meanwhile
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace scingest::upload
