#pragma once

#include "scingest/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace scingest::events {
class EventBus;
}

namespace scingest::upload {

/**
 * @brief Single read path for per-job transfer progress
 *
 * bytes_uploaded only grows, and stops changing once the job reports a
 * terminal status. Speed is the average over a sliding window of recent
 * samples, in megabytes (10^6 bytes) per second; with fewer than two
 * samples in the window both speed and ETA read 0.
 *
 * Each accepted mutation publishes a ProgressUpdatedEvent when a bus is
 * attached.
 */
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressAggregator(events::EventBus* bus = nullptr,
                                std::chrono::milliseconds window = std::chrono::seconds(5));

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void register_job(const std::string& job_id,
                      std::uint64_t bytes_total,
                      std::string current_file,
                      std::uint64_t bytes_already_uploaded = 0);

    void add_bytes(const std::string& job_id, std::uint64_t bytes);
    void add_bytes_at(const std::string& job_id, std::uint64_t bytes, Clock::time_point at);

    void set_status(const std::string& job_id, JobStatus status, std::string error_message = {});

    [[nodiscard]] std::optional<UploadProgress> get_progress(const std::string& job_id) const;
    [[nodiscard]] bool contains(const std::string& job_id) const;

    void remove(const std::string& job_id);

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t cumulative_bytes;
    };

    struct Entry {
        mutable std::mutex mutex;
        UploadProgress progress;
        std::deque<Sample> samples;
    };

    std::shared_ptr<Entry> find(const std::string& job_id) const;
    void recompute(Entry& entry, Clock::time_point now) const;
    void publish(const UploadProgress& snapshot) const;

    events::EventBus* bus_;
    std::chrono::milliseconds window_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace scingest::upload
