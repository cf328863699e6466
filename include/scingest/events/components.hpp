/**
 * @file components.hpp
 * @brief Observers that turn ingest events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every job and chunk event is now logged and counted
 */

#pragma once

#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace scingest::events {

/**
 * @brief Writes job and chunk events through spdlog
 *
 * Chunk-level events go to debug, lifecycle events to info, failures to warn.
 * Progress snapshots are logged at trace only.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<JobQueuedEvent>([](const JobQueuedEvent& e) {
            spdlog::info("[JobQueued] job={} file={} bytes={} chunks={}{}",
                         e.job_id, e.file_name, e.total_bytes, e.total_chunks,
                         e.resumed_from ? " resumed_from=" + *e.resumed_from : std::string());
        });

        track<JobStateChangedEvent>([](const JobStateChangedEvent& e) {
            spdlog::info("[JobState] job={} {} -> {}",
                         e.job_id, upload::to_string(e.from), upload::to_string(e.to));
        });

        track<JobCompletedEvent>([](const JobCompletedEvent& e) {
            spdlog::info("[JobCompleted] job={} path={} bytes={} checksum={} duration={}ms",
                         e.job_id, e.output_path, e.total_bytes, e.checksum, e.duration.count());
        });

        track<JobFailedEvent>([](const JobFailedEvent& e) {
            spdlog::warn("[JobFailed] job={} error={}", e.job_id, e.error.describe());
        });

        track<JobCancelledEvent>([](const JobCancelledEvent& e) {
            spdlog::info("[JobCancelled] job={}", e.job_id);
        });

        track<ChunkCommittedEvent>([](const ChunkCommittedEvent& e) {
            spdlog::debug("[ChunkCommitted] job={} chunk={}/{} bytes={}",
                          e.job_id, e.chunk_index + 1, e.total_chunks, e.bytes);
        });

        track<ChunkRetryEvent>([](const ChunkRetryEvent& e) {
            spdlog::debug("[ChunkRetry] job={} chunk={} attempt={} delay={}ms reason={}",
                          e.job_id, e.chunk_index, e.attempt, e.delay.count(), e.reason);
        });

        track<ProgressUpdatedEvent>([](const ProgressUpdatedEvent& e) {
            spdlog::trace("[Progress] job={} {:.1f}% {:.2f}MB/s eta={:.0f}s",
                          e.progress.job_id, e.progress.progress_percentage,
                          e.progress.speed_mbps, e.progress.eta_seconds);
        });

        track<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("Ingest server listening on port {}", e.port);
        });

        track<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Ingest server shutting down: {}", e.reason);
        });
    }

    ~LoggerComponent() {
        for (auto& release : releases_) {
            release();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Counts ingest activity for the health endpoint and shutdown summary
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto committed = metrics.get_stats().chunks_committed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> jobs_queued{0};
        std::atomic<std::uint64_t> jobs_resumed{0};
        std::atomic<std::uint64_t> jobs_completed{0};
        std::atomic<std::uint64_t> jobs_failed{0};
        std::atomic<std::uint64_t> jobs_timed_out{0};
        std::atomic<std::uint64_t> jobs_cancelled{0};
        std::atomic<std::uint64_t> chunks_committed{0};
        std::atomic<std::uint64_t> chunk_retries{0};
        std::atomic<std::uint64_t> bytes_committed{0};
        std::atomic<std::uint64_t> bytes_completed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<JobQueuedEvent>([this](const JobQueuedEvent& e) {
            stats_.jobs_queued++;
            if (e.resumed_from) {
                stats_.jobs_resumed++;
            }
        }));
        ids_.push_back(bus_.subscribe<JobCompletedEvent>([this](const JobCompletedEvent& e) {
            stats_.jobs_completed++;
            stats_.bytes_completed += e.total_bytes;
        }));
        ids_.push_back(bus_.subscribe<JobFailedEvent>([this](const JobFailedEvent& e) {
            stats_.jobs_failed++;
            if (e.error.code == ErrorCode::TimeoutExceeded) {
                stats_.jobs_timed_out++;
            }
        }));
        ids_.push_back(bus_.subscribe<JobCancelledEvent>([this](const JobCancelledEvent&) {
            stats_.jobs_cancelled++;
        }));
        ids_.push_back(bus_.subscribe<ChunkCommittedEvent>([this](const ChunkCommittedEvent& e) {
            stats_.chunks_committed++;
            stats_.bytes_committed += e.bytes;
        }));
        ids_.push_back(bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent&) {
            stats_.chunk_retries++;
        }));
    }

    ~MetricsComponent() {
        bus_.unsubscribe<JobQueuedEvent>(ids_[0]);
        bus_.unsubscribe<JobCompletedEvent>(ids_[1]);
        bus_.unsubscribe<JobFailedEvent>(ids_[2]);
        bus_.unsubscribe<JobCancelledEvent>(ids_[3]);
        bus_.unsubscribe<ChunkCommittedEvent>(ids_[4]);
        bus_.unsubscribe<ChunkRetryEvent>(ids_[5]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Ingest statistics:");
        spdlog::info("  Jobs queued:      {} ({} resumed)", stats_.jobs_queued.load(), stats_.jobs_resumed.load());
        spdlog::info("  Jobs completed:   {}", stats_.jobs_completed.load());
        spdlog::info("  Jobs failed:      {} ({} timed out)", stats_.jobs_failed.load(), stats_.jobs_timed_out.load());
        spdlog::info("  Jobs cancelled:   {}", stats_.jobs_cancelled.load());
        spdlog::info("  Chunks committed: {} ({} bytes)", stats_.chunks_committed.load(), stats_.bytes_committed.load());
        spdlog::info("  Chunk retries:    {}", stats_.chunk_retries.load());
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::vector<std::size_t> ids_;
};

} // namespace scingest::events
