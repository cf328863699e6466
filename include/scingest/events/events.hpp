/**
 * @file events.hpp
 * @brief Event types published while ingest jobs run
 *
 * NAMING CONVENTION:
 * Events are past-tense: JobQueuedEvent, ChunkCommittedEvent.
 *
 * Core components never log; they publish these and the LoggerComponent
 * and MetricsComponent react.
 */

#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace scingest::events {

// ════════════════════════════════════════════════════════
// Job Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a job is accepted by the service
 *
 * WHO EMITS: UploadService::initiate
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct JobQueuedEvent {
    std::string job_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::size_t total_chunks = 0;
    std::optional<std::string> resumed_from;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after every accepted lifecycle transition
 */
struct JobStateChangedEvent {
    std::string job_id;
    upload::JobStatus from = upload::JobStatus::Queued;
    upload::JobStatus to = upload::JobStatus::Queued;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobCompletedEvent {
    std::string job_id;
    std::string output_path;
    std::string checksum;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobFailedEvent {
    std::string job_id;
    UploadError error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobCancelledEvent {
    std::string job_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted the first time a chunk index is durably committed
 *
 * WHO EMITS: UploadService::put_chunk, TransferWorkerPool
 */
struct ChunkCommittedEvent {
    std::string job_id;
    std::size_t chunk_index = 0;
    std::size_t total_chunks = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a worker backs off before retrying a chunk
 */
struct ChunkRetryEvent {
    std::string job_id;
    std::size_t chunk_index = 0;
    int attempt = 0;  ///< The attempt that just failed
    std::chrono::milliseconds delay{0};
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Snapshot published on every accepted progress mutation
 */
struct ProgressUpdatedEvent {
    upload::UploadProgress progress;
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(std::uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace scingest::events
