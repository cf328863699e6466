#include "scingest/upload/progress_aggregator.hpp"

#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"

#include <algorithm>

namespace scingest::upload {
namespace {

constexpr double kBytesPerMegabyte = 1e6;
constexpr double kMinSpeedMbps = 1e-6;

} // namespace

ProgressAggregator::ProgressAggregator(events::EventBus* bus, std::chrono::milliseconds window)
    : bus_(bus), window_(window) {
}

void ProgressAggregator::register_job(const std::string& job_id,
                                      std::uint64_t bytes_total,
                                      std::string current_file,
                                      std::uint64_t bytes_already_uploaded) {
    auto entry = std::make_shared<Entry>();
    entry->progress.job_id = job_id;
    entry->progress.status = JobStatus::Queued;
    entry->progress.bytes_total = bytes_total;
    entry->progress.current_file = std::move(current_file);
    entry->progress.bytes_uploaded = std::min(bytes_already_uploaded, bytes_total);
    recompute(*entry, Clock::now());

    UploadProgress snapshot = entry->progress;
    {
        std::unique_lock lock(mutex_);
        entries_[job_id] = std::move(entry);
    }
    publish(snapshot);
}

void ProgressAggregator::add_bytes(const std::string& job_id, std::uint64_t bytes) {
    add_bytes_at(job_id, bytes, Clock::now());
}

void ProgressAggregator::add_bytes_at(const std::string& job_id, std::uint64_t bytes, Clock::time_point at) {
    auto entry = find(job_id);
    if (!entry) {
        return;
    }

    UploadProgress snapshot;
    {
        std::lock_guard lock(entry->mutex);
        auto& progress = entry->progress;
        if (is_terminal(progress.status)) {
            return;
        }
        progress.bytes_uploaded = std::min(progress.bytes_uploaded + bytes, progress.bytes_total);
        entry->samples.push_back({at, progress.bytes_uploaded});
        recompute(*entry, at);
        snapshot = progress;
    }
    publish(snapshot);
}

void ProgressAggregator::set_status(const std::string& job_id, JobStatus status, std::string error_message) {
    auto entry = find(job_id);
    if (!entry) {
        return;
    }

    UploadProgress snapshot;
    {
        std::lock_guard lock(entry->mutex);
        auto& progress = entry->progress;
        if (is_terminal(progress.status)) {
            return;
        }
        progress.status = status;
        if (!error_message.empty()) {
            progress.error_message = std::move(error_message);
        }
        if (status == JobStatus::Paused || is_terminal(status)) {
            entry->samples.clear();
        }
        recompute(*entry, Clock::now());
        snapshot = progress;
    }
    publish(snapshot);
}

std::optional<UploadProgress> ProgressAggregator::get_progress(const std::string& job_id) const {
    auto entry = find(job_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard lock(entry->mutex);
    return entry->progress;
}

bool ProgressAggregator::contains(const std::string& job_id) const {
    return find(job_id) != nullptr;
}

void ProgressAggregator::remove(const std::string& job_id) {
    std::unique_lock lock(mutex_);
    entries_.erase(job_id);
}

std::shared_ptr<ProgressAggregator::Entry> ProgressAggregator::find(const std::string& job_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(job_id);
    return it != entries_.end() ? it->second : nullptr;
}

void ProgressAggregator::recompute(Entry& entry, Clock::time_point now) const {
    auto& progress = entry.progress;
    auto& samples = entry.samples;

    while (!samples.empty() && now - samples.front().at > window_) {
        samples.pop_front();
    }

    if (progress.bytes_total > 0) {
        progress.progress_percentage =
            static_cast<double>(progress.bytes_uploaded) * 100.0 / static_cast<double>(progress.bytes_total);
    } else {
        // An empty file is fully transferred once its single chunk is past the upload stage.
        const bool transferred = progress.status == JobStatus::Processing ||
                                 progress.status == JobStatus::Verifying ||
                                 progress.status == JobStatus::Completed;
        progress.progress_percentage = transferred ? 100.0 : 0.0;
    }

    progress.speed_mbps = 0.0;
    progress.eta_seconds = 0.0;
    if (samples.size() >= 2) {
        const auto& first = samples.front();
        const auto& last = samples.back();
        const double elapsed = std::chrono::duration<double>(last.at - first.at).count();
        if (elapsed > 0.0) {
            const auto delta = static_cast<double>(last.cumulative_bytes - first.cumulative_bytes);
            progress.speed_mbps = delta / kBytesPerMegabyte / elapsed;
            const double remaining_mb =
                static_cast<double>(progress.bytes_total - progress.bytes_uploaded) / kBytesPerMegabyte;
            progress.eta_seconds = remaining_mb / std::max(progress.speed_mbps, kMinSpeedMbps);
        }
    }

    progress.last_updated = std::chrono::system_clock::now();
}

void ProgressAggregator::publish(const UploadProgress& snapshot) const {
    if (bus_) {
        bus_->emit(events::ProgressUpdatedEvent{snapshot});
    }
}

} // namespace scingest::upload
