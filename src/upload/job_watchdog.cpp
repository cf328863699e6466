#include "scingest/upload/job_watchdog.hpp"

#include "scingest/upload/upload_service.hpp"

#include <spdlog/spdlog.h>

namespace scingest::upload {

JobWatchdog::JobWatchdog(UploadService& service, std::chrono::milliseconds interval)
    : service_(service),
      interval_(interval) {
}

JobWatchdog::~JobWatchdog() {
    stop();
}

void JobWatchdog::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void JobWatchdog::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t JobWatchdog::sweeps() const {
    std::lock_guard lock(mutex_);
    return sweeps_;
}

void JobWatchdog::run() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();

        const std::size_t timed_out = service_.enforce_timeouts();
        const std::size_t evicted = service_.evict_terminal_jobs();
        if (timed_out > 0 || evicted > 0) {
            spdlog::info("[watchdog] {} job(s) timed out, {} evicted", timed_out, evicted);
        }

        lock.lock();
        sweeps_++;
    }
}

} // namespace scingest::upload
