#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/cancellation.hpp"
#include "scingest/upload/chunk_transport.hpp"
#include "scingest/upload/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace scingest::events {
class EventBus;
}

namespace scingest::upload {

class ResumeLedger;
class ProgressAggregator;

struct TransferReport {
    std::size_t chunks_uploaded = 0;  ///< Committed by this run
    std::size_t chunks_skipped = 0;   ///< Already in the ledger
    std::size_t retries = 0;
    std::uint64_t bytes_uploaded = 0;
};

/**
 * @brief Uploads the chunks of one job with bounded parallelism
 *
 * Workers pull chunk indices from a shared queue. For each chunk a worker
 * reads the bytes, hashes them, transmits them and, once the receiver
 * acknowledges the same checksum, commits the index in the ledger and
 * credits the progress aggregator (first commit only).
 *
 * A failed attempt is retried per the RetryPolicy. When a chunk exhausts
 * its attempts, or the receiver rejects it permanently (integrity, state or
 * unknown job), the remaining workers stop
 * and upload() returns that error. Cancelling the token makes every worker
 * stop at its next check; upload() then returns CancelledByUser unless the
 * transfer finished anyway.
 */
class TransferWorkerPool {
public:
    TransferWorkerPool(std::size_t max_workers,
                       RetryPolicy policy,
                       ChunkReader& reader,
                       ChunkTransport& transport,
                       ResumeLedger& ledger,
                       ProgressAggregator& progress,
                       events::EventBus* bus = nullptr);

    UploadResult<TransferReport> upload(const std::string& job_id,
                                        const ChunkManifest& manifest,
                                        const std::set<std::size_t>& already_committed,
                                        CancellationToken& cancellation);

    [[nodiscard]] std::size_t max_workers() const noexcept { return max_workers_; }

private:
    struct RunState {
        std::atomic<bool> stop{false};
        std::atomic<std::size_t> uploaded{0};
        std::atomic<std::size_t> skipped{0};
        std::atomic<std::size_t> retries{0};
        std::atomic<std::uint64_t> bytes{0};
        std::mutex error_mutex;
        std::optional<UploadError> first_error;
    };

    UploadResult<void> transfer_chunk(const std::string& job_id,
                                      const ChunkDescriptor& chunk,
                                      std::size_t total_chunks,
                                      CancellationToken& cancellation,
                                      RunState& run);

    // Backoff sleep that also wakes when another worker hit a fatal error.
    bool interrupted_during(std::chrono::milliseconds delay,
                            CancellationToken& cancellation,
                            const RunState& run) const;

    std::size_t max_workers_;
    RetryPolicy policy_;
    ChunkReader& reader_;
    ChunkTransport& transport_;
    ResumeLedger& ledger_;
    ProgressAggregator& progress_;
    events::EventBus* bus_;
};

} // namespace scingest::upload
