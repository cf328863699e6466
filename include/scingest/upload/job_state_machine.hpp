#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace scingest::upload {

enum class JobEvent {
    PickUp,
    ManifestReady,
    AllChunksCommitted,
    Pause,
    Resume,
    Cancel,
    ConverterInvoked,
    Verified,
    Fail,
    Timeout
};

const char* to_string(JobEvent event) noexcept;

/**
 * @brief Canonical lifecycle of one ingest job
 *
 * Every mutation goes through apply(), which consults a single transition
 * table. An event the table does not list for the current state, including
 * any event on COMPLETED, FAILED or CANCELLED, yields InvalidTransition and
 * leaves the state untouched.
 *
 * Not synchronized; the owning job record's lock guards it.
 */
class JobStateMachine {
public:
    JobStateMachine();

    [[nodiscard]] JobStatus state() const noexcept { return state_; }
    [[nodiscard]] bool terminal() const noexcept { return is_terminal(state_); }

    UploadResult<JobStatus> apply(JobEvent event);

    /**
     * @brief Apply Fail (or Timeout for TimeoutExceeded) and remember the cause
     */
    UploadResult<JobStatus> fail(UploadError cause);

    [[nodiscard]] const std::optional<UploadError>& failure() const noexcept { return failure_; }

    // FAILED with a cause after which the data may still be continued.
    [[nodiscard]] bool failed_transiently() const noexcept;

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

    [[nodiscard]] static std::optional<JobStatus> target(JobStatus from, JobEvent event) noexcept;

private:
    JobStatus state_ = JobStatus::Queued;
    std::optional<UploadError> failure_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace scingest::upload
