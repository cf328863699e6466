#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/chunk_transport.hpp"
#include "scingest/upload/job_state_machine.hpp"
#include "scingest/upload/types.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace scingest::events {
class EventBus;
}

namespace scingest::upload {

class ChunkStore;
class ConversionDispatcher;
class JobRegistry;
class ProgressAggregator;
class ResumeLedger;
struct JobRecord;

struct ServiceOptions {
    std::filesystem::path destination_root;
    std::uint64_t max_file_size = 10ULL * 1024 * 1024 * 1024 * 1024;
    std::uint64_t default_chunk_size = 64ULL * 1024 * 1024;
    std::uint64_t min_chunk_size = 1ULL * 1024 * 1024;
    std::uint64_t max_chunk_size = 1024ULL * 1024 * 1024;
    std::size_t max_workers = 4;           ///< Per server-side transfer
    std::size_t max_concurrent_jobs = 2;   ///< Executor threads
    RetryPolicy default_retry;
    std::chrono::milliseconds default_timeout{std::chrono::minutes(120)};
    std::chrono::milliseconds retention{std::chrono::hours(24 * 7)};
};

struct InitiateResponse {
    std::string job_id;
    JobStatus status = JobStatus::Queued;
    std::uint64_t chunk_size = 0;
    std::size_t total_chunks = 0;
};

struct ChunkReceipt {
    bool committed = false;
    bool duplicate = false;
    std::string checksum;
    std::uint64_t bytes_uploaded = 0;
};

struct ServiceLimits {
    std::uint64_t max_file_size = 0;
    std::uint64_t default_chunk_size = 0;
    std::uint64_t min_chunk_size = 0;
    std::uint64_t max_chunk_size = 0;
    std::chrono::milliseconds default_timeout{0};
    std::chrono::milliseconds retention{0};
    std::size_t max_workers = 0;
    std::size_t max_concurrent_jobs = 0;
    std::vector<std::string> source_types;
    std::vector<std::string> sensors;
};

struct ServiceHealth {
    std::size_t active_jobs = 0;
    std::size_t total_jobs = 0;
};

/**
 * @brief Entry point for every upload operation
 *
 * Local sources are pushed by the client one chunk at a time through
 * put_chunk(); a pushed job stays QUEUED until its first chunk arrives.
 * Other sources are pulled by a TransferWorkerPool running on the service
 * executor, whose thread count is the cap on concurrently running jobs.
 *
 * When the ledger holds every chunk of a job, PROCESSING is scheduled on the
 * executor: the chunks are assembled into
 * <destination_root>/<destination or dataset_id>/<file_name>, handed to the
 * ConversionDispatcher when auto_convert is set, verified against the
 * expected whole-file checksum and the job completes.
 *
 * Every live job has a deadline timer on a dedicated thread, so a job fails
 * with TimeoutExceeded as soon as its timeout elapses even when all executor
 * threads are busy. A chunk becomes visible in the staging area only in the
 * same critical section that commits it to the ledger.
 *
 * Events are emitted while the job's lock is held; subscribers must not
 * call back into the service for the same job.
 */
class UploadService {
public:
    using ReaderFactory =
        std::function<UploadResult<std::shared_ptr<ChunkReader>>(const UploadJobConfig&)>;

    UploadService(ServiceOptions options,
                  JobRegistry& registry,
                  ResumeLedger& ledger,
                  ProgressAggregator& progress,
                  ChunkStore& store,
                  ConversionDispatcher& dispatcher,
                  events::EventBus& bus);
    ~UploadService();

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    /**
     * @brief Readers for non-local sources; without one such jobs are rejected
     */
    void set_reader_factory(ReaderFactory factory);

    // A config pre-filled with the service defaults.
    [[nodiscard]] UploadJobConfig job_defaults() const;

    UploadResult<InitiateResponse> initiate(UploadJobConfig config);

    /**
     * @brief Rebuild the jobs whose ledger journals outlived a restart
     *
     * Each journaled job not in the registry comes back QUEUED under its old
     * id with its committed chunks, and its timeout starts over. Journals
     * that cannot be turned back into a job are purged together with their
     * staged chunks.
     *
     * RETURNS: number of jobs restored
     */
    std::size_t recover();

    /**
     * @brief Store and commit one chunk; idempotent per (job, index, content)
     *
     * ERRORS:
     * - NotFound: unknown job
     * - InvalidConfig: index outside the manifest
     * - ChunkRejected: wrong length, or bytes do not match `checksum`
     * - IntegrityError: index already committed with other content
     * - InvalidTransition: job not accepting chunks (paused, finished)
     */
    UploadResult<ChunkReceipt> put_chunk(const std::string& job_id,
                                         std::size_t index,
                                         const std::vector<std::uint8_t>& data,
                                         const std::string& checksum);

    UploadResult<ResumeInfo> resume_info(const std::string& job_id) const;
    UploadResult<UploadProgress> status(const std::string& job_id) const;
    UploadResult<ChunkStatus> chunk_status(const std::string& job_id) const;

    UploadResult<JobStatus> cancel(const std::string& job_id);
    UploadResult<JobStatus> pause(const std::string& job_id);
    UploadResult<JobStatus> resume(const std::string& job_id);

    /**
     * @brief Have the service pull the job's chunks from `reader`
     */
    UploadResult<void> start_transfer(const std::string& job_id, std::shared_ptr<ChunkReader> reader);

    /**
     * @brief Fail every live job older than its timeout
     *
     * RETURNS: number of jobs failed by this call
     */
    std::size_t enforce_timeouts();

    /**
     * @brief Drop terminal jobs finished longer than `retention` ago
     */
    std::size_t evict_terminal_jobs(std::chrono::milliseconds retention);
    std::size_t evict_terminal_jobs();

    [[nodiscard]] ServiceLimits limits() const;
    [[nodiscard]] ServiceHealth health() const;

    /**
     * @brief Stop transfers and wait for executor tasks to finish
     */
    void shutdown();

private:
    class LocalTransport;

    UploadResult<std::shared_ptr<JobRecord>> lookup(const std::string& job_id) const;
    UploadResult<void> validate(UploadJobConfig& config) const;
    std::string next_job_id();
    std::filesystem::path output_path(const UploadJobConfig& config) const;
    void discard_journal(const std::string& job_id);
    void admit(const std::shared_ptr<JobRecord>& record, ChunkManifest manifest,
               std::shared_ptr<ChunkReader> reader);

    // The *_locked helpers expect the record's mutex to be held.
    UploadResult<JobStatus> apply_locked(JobRecord& record, JobEvent event);
    UploadResult<JobStatus> fail_locked(JobRecord& record, UploadError error);
    UploadResult<JobStatus> activate_locked(JobRecord& record);
    void after_transition_locked(JobRecord& record, JobStatus from);
    bool all_committed_locked(const JobRecord& record) const;
    // Ok(true) when this exact chunk is already committed.
    UploadResult<bool> check_intake_locked(JobRecord& record, std::size_t index,
                                           const std::string& checksum, std::size_t length);
    bool expire_locked(JobRecord& record, std::chrono::steady_clock::time_point now);
    void arm_deadline_locked(const std::shared_ptr<JobRecord>& record);
    void disarm_deadline(const std::string& job_id);
    void schedule_processing_locked(const std::shared_ptr<JobRecord>& record);
    void schedule_transfer_locked(const std::shared_ptr<JobRecord>& record);

    void on_chunk_committed(const std::shared_ptr<JobRecord>& record);
    void run_transfer(const std::shared_ptr<JobRecord>& record);
    void run_processing(const std::shared_ptr<JobRecord>& record);
    void fail_job(const std::shared_ptr<JobRecord>& record, UploadError error);

    ServiceOptions options_;
    JobRegistry& registry_;
    ResumeLedger& ledger_;
    ProgressAggregator& progress_;
    ChunkStore& store_;
    ConversionDispatcher& dispatcher_;
    events::EventBus& bus_;
    ReaderFactory reader_factory_;

    std::mutex id_mutex_;
    std::mt19937_64 id_rng_;
    std::atomic<bool> stopping_{false};
    boost::asio::thread_pool executor_;
    boost::asio::thread_pool deadline_pool_;

    std::mutex deadline_mutex_;
    std::unordered_map<std::string, std::unique_ptr<boost::asio::steady_timer>> deadlines_;
};

} // namespace scingest::upload
