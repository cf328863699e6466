#include "scingest/upload/transfer_worker_pool.hpp"

#include "scingest/core/checksum.hpp"
#include "scingest/core/thread_safe_queue.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace scingest::upload {
namespace {

constexpr std::chrono::milliseconds kStopPollInterval{50};

// Rejections that another attempt cannot fix.
bool is_permanent(ErrorCode code) {
    return code == ErrorCode::IntegrityError || code == ErrorCode::InvalidTransition ||
           code == ErrorCode::NotFound || code == ErrorCode::InvalidConfig;
}

UploadError cancelled_error() {
    return make_error(ErrorCode::CancelledByUser, "transfer cancelled");
}

} // namespace

TransferWorkerPool::TransferWorkerPool(std::size_t max_workers,
                                       RetryPolicy policy,
                                       ChunkReader& reader,
                                       ChunkTransport& transport,
                                       ResumeLedger& ledger,
                                       ProgressAggregator& progress,
                                       events::EventBus* bus)
    : max_workers_(std::max<std::size_t>(1, max_workers)),
      policy_(policy),
      reader_(reader),
      transport_(transport),
      ledger_(ledger),
      progress_(progress),
      bus_(bus) {
}

UploadResult<TransferReport> TransferWorkerPool::upload(const std::string& job_id,
                                                        const ChunkManifest& manifest,
                                                        const std::set<std::size_t>& already_committed,
                                                        CancellationToken& cancellation) {
    RunState run;
    ThreadSafeQueue<std::size_t> work;
    for (const auto& chunk : manifest) {
        if (already_committed.count(chunk.index) > 0) {
            run.skipped++;
        } else {
            work.push(chunk.index);
        }
    }
    work.close();

    const std::size_t worker_count = std::min(max_workers_, std::max<std::size_t>(1, work.size()));

    auto worker = [&]() {
        while (!run.stop.load() && !cancellation.cancelled()) {
            auto index = work.pop();
            if (!index) {
                return;
            }
            if (ledger_.is_committed(job_id, *index)) {
                run.skipped++;
                continue;
            }

            auto result = transfer_chunk(job_id, manifest[*index], manifest.size(), cancellation, run);
            if (result.is_error()) {
                if (result.error().code == ErrorCode::CancelledByUser) {
                    return;
                }
                {
                    std::lock_guard lock(run.error_mutex);
                    if (!run.first_error) {
                        run.first_error = std::move(result.error());
                    }
                }
                run.stop.store(true);
                work.clear();
                return;
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (run.first_error) {
        return Err(std::move(*run.first_error));
    }

    TransferReport report;
    report.chunks_uploaded = run.uploaded.load();
    report.chunks_skipped = run.skipped.load();
    report.retries = run.retries.load();
    report.bytes_uploaded = run.bytes.load();

    const bool finished = std::all_of(manifest.begin(), manifest.end(), [&](const ChunkDescriptor& chunk) {
        return ledger_.is_committed(job_id, chunk.index);
    });
    if (finished) {
        return Ok(report);
    }
    if (cancellation.cancelled()) {
        return Err(cancelled_error());
    }
    return Err(make_error(ErrorCode::IoError, "transfer ended with chunks still missing"));
}

UploadResult<void> TransferWorkerPool::transfer_chunk(const std::string& job_id,
                                                      const ChunkDescriptor& chunk,
                                                      std::size_t total_chunks,
                                                      CancellationToken& cancellation,
                                                      RunState& run) {
    const int attempts = policy_.attempts();
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (cancellation.cancelled() || run.stop.load()) {
            return Err(cancelled_error());
        }

        auto payload = reader_.read(chunk);
        if (payload.is_ok()) {
            const std::string checksum = checksum_hex(payload.value());
            auto ack = transport_.transmit(job_id, chunk, payload.value(), checksum, policy_.chunk_timeout);

            if (ack.is_ok() && ack.value().committed && ack.value().checksum == checksum) {
                auto commit = ledger_.commit(job_id, chunk.index, checksum, chunk.length);
                if (commit.is_error()) {
                    return Err(std::move(commit.error()));
                }
                if (commit.value() == CommitOutcome::Committed) {
                    progress_.add_bytes(job_id, chunk.length);
                    run.uploaded++;
                    run.bytes += chunk.length;
                    if (bus_) {
                        bus_->emit(events::ChunkCommittedEvent{job_id, chunk.index, total_chunks, chunk.length});
                    }
                }
                return Ok();
            }

            if (ack.is_error()) {
                if (is_permanent(ack.error().code)) {
                    auto fatal = std::move(ack.error());
                    fatal.chunk_index = chunk.index;
                    return Err(std::move(fatal));
                }
                last_error = ack.error().describe();
            } else if (!ack.value().committed) {
                last_error = "receiver did not commit the chunk";
            } else {
                last_error = "receiver checksum " + ack.value().checksum + " does not match " + checksum;
            }
        } else {
            last_error = payload.error().describe();
        }

        if (attempt < attempts) {
            const auto delay = policy_.delay_for_attempt(attempt);
            run.retries++;
            if (bus_) {
                bus_->emit(events::ChunkRetryEvent{job_id, chunk.index, attempt, delay, last_error});
            }
            if (interrupted_during(delay, cancellation, run)) {
                return Err(cancelled_error());
            }
        }
    }

    return Err(make_error(ErrorCode::ChunkUploadFailed,
                          "gave up after " + std::to_string(attempts) + " attempt(s): " + last_error,
                          chunk.index));
}

bool TransferWorkerPool::interrupted_during(std::chrono::milliseconds delay,
                                            CancellationToken& cancellation,
                                            const RunState& run) const {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (run.stop.load()) {
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return cancellation.cancelled();
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kStopPollInterval);
        if (cancellation.wait_for(slice)) {
            return true;
        }
    }
}

} // namespace scingest::upload
