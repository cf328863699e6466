#pragma once

#include "scingest/upload/cancellation.hpp"
#include "scingest/upload/chunk_transport.hpp"
#include "scingest/upload/job_state_machine.hpp"
#include "scingest/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace scingest::upload {

/**
 * @brief Everything the service tracks for one job besides its progress
 *
 * All fields are guarded by `mutex`, except `token`, which is thread-safe
 * on its own and is polled by transfer workers.
 */
struct JobRecord {
    explicit JobRecord(UploadJobConfig cfg)
        : config(std::move(cfg)),
          accepted_at(std::chrono::steady_clock::now()) {}

    mutable std::mutex mutex;
    UploadJobConfig config;
    JobStateMachine machine;
    ChunkManifest manifest;
    CancellationToken token;

    std::shared_ptr<ChunkReader> reader;  ///< Set for server-side (pull) transfers
    bool transfer_running = false;
    bool processing_scheduled = false;    ///< Last chunk observed; PROCESSING is on its way
    std::chrono::steady_clock::time_point accepted_at;
    std::chrono::steady_clock::time_point finished_at{};
};

/**
 * @brief Job id to job record map, owned by whoever wires the service
 */
class JobRegistry {
public:
    JobRegistry() = default;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Fails (returns nullptr) when the id is taken.
    std::shared_ptr<JobRecord> insert(UploadJobConfig config);

    [[nodiscard]] std::shared_ptr<JobRecord> find(const std::string& job_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<JobRecord>> snapshot() const;

    bool erase(const std::string& job_id);
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobRecord>> jobs_;
};

} // namespace scingest::upload
