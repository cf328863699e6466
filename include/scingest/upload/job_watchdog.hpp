#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace scingest::upload {

class UploadService;

/**
 * @brief Background thread enforcing job timeouts and retention
 *
 * Every `interval` it calls UploadService::enforce_timeouts() and then
 * evict_terminal_jobs(). stop() wakes the thread immediately.
 *
 * THREAD SAFETY:
 * - start()/stop() from the owning thread only
 * - The service must outlive the watchdog
 */
class JobWatchdog {
public:
    JobWatchdog(UploadService& service, std::chrono::milliseconds interval);
    ~JobWatchdog();

    JobWatchdog(const JobWatchdog&) = delete;
    JobWatchdog& operator=(const JobWatchdog&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] std::size_t sweeps() const;

private:
    void run();

    UploadService& service_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::size_t sweeps_ = 0;
    std::thread thread_;
};

} // namespace scingest::upload
