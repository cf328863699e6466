#include "scingest/upload/job_state_machine.hpp"

#include <unordered_map>
#include <utility>
#include <vector>

namespace scingest::upload {
namespace {

using Edge = std::pair<JobEvent, JobStatus>;

const std::unordered_map<JobStatus, std::vector<Edge>>& transition_table() {
    static const std::unordered_map<JobStatus, std::vector<Edge>> table {
        {JobStatus::Queued, {
            {JobEvent::PickUp, JobStatus::Initializing},
            {JobEvent::Cancel, JobStatus::Cancelled},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
        {JobStatus::Initializing, {
            {JobEvent::ManifestReady, JobStatus::Uploading},
            {JobEvent::Fail, JobStatus::Failed},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
        {JobStatus::Uploading, {
            {JobEvent::AllChunksCommitted, JobStatus::Processing},
            {JobEvent::Pause, JobStatus::Paused},
            {JobEvent::Cancel, JobStatus::Cancelled},
            {JobEvent::Fail, JobStatus::Failed},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
        {JobStatus::Paused, {
            {JobEvent::Resume, JobStatus::Uploading},
            {JobEvent::Cancel, JobStatus::Cancelled},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
        {JobStatus::Processing, {
            {JobEvent::ConverterInvoked, JobStatus::Verifying},
            {JobEvent::Fail, JobStatus::Failed},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
        {JobStatus::Verifying, {
            {JobEvent::Verified, JobStatus::Completed},
            {JobEvent::Fail, JobStatus::Failed},
            {JobEvent::Timeout, JobStatus::Failed},
        }},
    };
    return table;
}

} // namespace

const char* to_string(JobEvent event) noexcept {
    switch (event) {
        case JobEvent::PickUp: return "PickUp";
        case JobEvent::ManifestReady: return "ManifestReady";
        case JobEvent::AllChunksCommitted: return "AllChunksCommitted";
        case JobEvent::Pause: return "Pause";
        case JobEvent::Resume: return "Resume";
        case JobEvent::Cancel: return "Cancel";
        case JobEvent::ConverterInvoked: return "ConverterInvoked";
        case JobEvent::Verified: return "Verified";
        case JobEvent::Fail: return "Fail";
        case JobEvent::Timeout: return "Timeout";
    }
    return "Unknown";
}

JobStateMachine::JobStateMachine()
    : last_transition_(std::chrono::system_clock::now()) {
}

std::optional<JobStatus> JobStateMachine::target(JobStatus from, JobEvent event) noexcept {
    const auto& table = transition_table();
    const auto it = table.find(from);
    if (it == table.end()) {
        return std::nullopt;
    }
    for (const auto& [allowed, to] : it->second) {
        if (allowed == event) {
            return to;
        }
    }
    return std::nullopt;
}

UploadResult<JobStatus> JobStateMachine::apply(JobEvent event) {
    const auto next = target(state_, event);
    if (!next) {
        return Err(make_error(ErrorCode::InvalidTransition,
                              std::string("cannot apply ") + to_string(event) +
                              " in state " + upload::to_string(state_)));
    }
    state_ = *next;
    last_transition_ = std::chrono::system_clock::now();
    return Ok(state_);
}

UploadResult<JobStatus> JobStateMachine::fail(UploadError cause) {
    const JobEvent event = cause.code == ErrorCode::TimeoutExceeded ? JobEvent::Timeout : JobEvent::Fail;
    auto result = apply(event);
    if (result.is_ok()) {
        failure_ = std::move(cause);
    }
    return result;
}

bool JobStateMachine::failed_transiently() const noexcept {
    return state_ == JobStatus::Failed && failure_ && is_transient(failure_->code);
}

} // namespace scingest::upload
