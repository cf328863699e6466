#include "scingest/upload/upload_service.hpp"

#include "scingest/core/checksum.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"
#include "scingest/upload/chunk_planner.hpp"
#include "scingest/upload/chunk_store.hpp"
#include "scingest/upload/conversion.hpp"
#include "scingest/upload/job_registry.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"
#include "scingest/upload/transfer_worker_pool.hpp"

#include <boost/asio/post.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace scingest::upload {
namespace {

std::size_t executor_threads(const ServiceOptions& options) {
    return std::max<std::size_t>(1, options.max_concurrent_jobs);
}

bool is_hex_digest(const std::string& text) {
    return text.size() == 16 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool escapes_root(const fs::path& path) {
    if (path.is_absolute()) {
        return true;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

// What goes into the ledger journal header to rebuild a job after a restart.
json describe_job(const UploadJobConfig& config) {
    json descriptor{
        {"file_name", config.file_name},
        {"file_size", config.file_size},
        {"chunk_size", config.chunk_size},
        {"dataset_id", config.dataset_id},
        {"destination", config.destination.string()},
        {"source", {{"kind", to_string(config.source.kind)}, {"location", config.source.location}}},
        {"sensor", to_string(config.sensor)},
        {"convert", config.auto_convert},
        {"verify_checksum", config.verify_checksum},
        {"timeout_ms", config.timeout.count()},
        {"retry", {{"max_retries", config.retry.max_retries},
                   {"retry_delay_ms", config.retry.retry_delay.count()},
                   {"backoff", to_string(config.retry.backoff)},
                   {"max_delay_ms", config.retry.max_delay.count()},
                   {"chunk_timeout_ms", config.retry.chunk_timeout.count()}}},
    };
    if (config.file_checksum) {
        descriptor["file_checksum"] = *config.file_checksum;
    }
    return descriptor;
}

UploadResult<UploadJobConfig> restore_job(const std::string& job_id, const json& descriptor) {
    using std::chrono::milliseconds;

    UploadJobConfig config;
    config.job_id = job_id;
    try {
        config.file_name = descriptor.at("file_name").get<std::string>();
        config.file_size = descriptor.at("file_size").get<std::uint64_t>();
        config.chunk_size = descriptor.at("chunk_size").get<std::uint64_t>();
        config.dataset_id = descriptor.at("dataset_id").get<std::string>();
        config.destination = descriptor.value("destination", std::string());
        config.auto_convert = descriptor.value("convert", true);
        config.verify_checksum = descriptor.value("verify_checksum", true);
        config.timeout = milliseconds(descriptor.at("timeout_ms").get<std::int64_t>());
        if (descriptor.contains("file_checksum")) {
            config.file_checksum = descriptor.at("file_checksum").get<std::string>();
        }

        const auto& source = descriptor.at("source");
        const auto kind = source_kind_from_string(source.at("kind").get<std::string>());
        const auto sensor = sensor_from_string(descriptor.value("sensor", std::string("OTHER")));
        if (!kind || !sensor) {
            return Err(make_error(ErrorCode::InvalidConfig, "job " + job_id + " has an unknown source or sensor"));
        }
        config.source = SourceDescriptor{*kind, source.value("location", std::string())};
        config.sensor = *sensor;

        const auto& retry = descriptor.at("retry");
        config.retry.max_retries = retry.at("max_retries").get<int>();
        config.retry.retry_delay = milliseconds(retry.at("retry_delay_ms").get<std::int64_t>());
        config.retry.max_delay = milliseconds(retry.at("max_delay_ms").get<std::int64_t>());
        config.retry.chunk_timeout = milliseconds(retry.at("chunk_timeout_ms").get<std::int64_t>());
        if (auto backoff = backoff_from_string(retry.value("backoff", std::string()))) {
            config.retry.backoff = *backoff;
        }
    } catch (const json::exception& e) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "unreadable descriptor for job " + job_id + ": " + e.what()));
    }
    return Ok(std::move(config));
}

} // namespace

// Server-side transfers deliver chunks through put_chunk, so pulled and
// pushed chunks are validated, stored and committed the same way.
class UploadService::LocalTransport : public ChunkTransport {
public:
    explicit LocalTransport(UploadService& service) : service_(service) {}

    UploadResult<ChunkAck> transmit(const std::string& job_id,
                                    const ChunkDescriptor& chunk,
                                    const std::vector<std::uint8_t>& payload,
                                    const std::string& checksum,
                                    std::chrono::milliseconds /*timeout*/) override {
        auto receipt = service_.put_chunk(job_id, chunk.index, payload, checksum);
        if (receipt.is_error()) {
            return Err(std::move(receipt.error()));
        }
        const auto& r = receipt.value();
        return Ok(ChunkAck{r.committed, r.checksum, r.bytes_uploaded});
    }

private:
    UploadService& service_;
};

UploadService::UploadService(ServiceOptions options,
                             JobRegistry& registry,
                             ResumeLedger& ledger,
                             ProgressAggregator& progress,
                             ChunkStore& store,
                             ConversionDispatcher& dispatcher,
                             events::EventBus& bus)
    : options_(std::move(options)),
      registry_(registry),
      ledger_(ledger),
      progress_(progress),
      store_(store),
      dispatcher_(dispatcher),
      bus_(bus),
      id_rng_(std::random_device{}()),
      executor_(executor_threads(options_)),
      deadline_pool_(1) {
}

UploadService::~UploadService() {
    shutdown();
}

void UploadService::set_reader_factory(ReaderFactory factory) {
    reader_factory_ = std::move(factory);
}

UploadJobConfig UploadService::job_defaults() const {
    UploadJobConfig config;
    config.chunk_size = options_.default_chunk_size;
    config.retry = options_.default_retry;
    config.timeout = options_.default_timeout;
    return config;
}

// ════════════════════════════════════════════════════════
// Job creation
// ════════════════════════════════════════════════════════

UploadResult<void> UploadService::validate(UploadJobConfig& config) const {
    if (config.file_name.empty() || config.file_name.find('/') != std::string::npos ||
        config.file_name == "." || config.file_name == "..") {
        return Err(make_error(ErrorCode::InvalidConfig, "file_name must be a plain file name"));
    }
    if (config.dataset_id.empty()) {
        return Err(make_error(ErrorCode::InvalidConfig, "dataset_id is required"));
    }
    if (escapes_root(config.destination)) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "destination must be a relative path without '..'"));
    }
    if (config.file_size > options_.max_file_size) {
        return Err(make_error(ErrorCode::PayloadTooLarge,
                              "file_size " + std::to_string(config.file_size) + " exceeds the limit of " +
                                  std::to_string(options_.max_file_size) + " bytes"));
    }

    if (config.chunk_size == 0) {
        config.chunk_size = options_.default_chunk_size;
    }
    if (config.chunk_size < options_.min_chunk_size || config.chunk_size > options_.max_chunk_size) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "chunk_size must be between " + std::to_string(options_.min_chunk_size) +
                                  " and " + std::to_string(options_.max_chunk_size) + " bytes"));
    }

    if (config.retry.max_retries < 0) {
        return Err(make_error(ErrorCode::InvalidConfig, "max_retries must not be negative"));
    }
    if (config.retry.retry_delay.count() < 0) {
        return Err(make_error(ErrorCode::InvalidConfig, "retry_delay must not be negative"));
    }
    if (config.timeout.count() <= 0) {
        config.timeout = options_.default_timeout;
    }

    if (config.source.kind != SourceKind::Local && config.source.location.empty()) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              std::string("source location is required for ") + to_string(config.source.kind) +
                                  " sources"));
    }

    if (config.file_checksum) {
        if (!is_hex_digest(*config.file_checksum)) {
            return Err(make_error(ErrorCode::InvalidConfig, "file_checksum must be 16 hex digits"));
        }
        config.file_checksum = lowercase(*config.file_checksum);
    }
    return Ok();
}

std::string UploadService::next_job_id() {
    std::uint64_t value;
    {
        std::lock_guard lock(id_mutex_);
        value = id_rng_();
    }
    return "upload_" + to_hex(value);
}

fs::path UploadService::output_path(const UploadJobConfig& config) const {
    const fs::path folder = config.destination.empty() ? fs::path(config.dataset_id) : config.destination;
    return options_.destination_root / folder / config.file_name;
}

UploadResult<InitiateResponse> UploadService::initiate(UploadJobConfig config) {
    if (stopping_.load()) {
        return Err(make_error(ErrorCode::InvalidTransition, "service is shutting down"));
    }

    // Inherit what the caller left out from the job being resumed.
    std::shared_ptr<JobRecord> previous;
    if (config.resume_from) {
        previous = registry_.find(*config.resume_from);
        if (!previous) {
            return Err(make_error(ErrorCode::NotFound, "no job " + *config.resume_from + " to resume from"));
        }
        std::lock_guard lock(previous->mutex);
        if (config.file_size == 0) {
            config.file_size = previous->config.file_size;
        }
        if (config.chunk_size == 0) {
            config.chunk_size = previous->config.chunk_size;
        }
        if (config.dataset_id.empty()) {
            config.dataset_id = previous->config.dataset_id;
        }
        if (config.destination.empty()) {
            config.destination = previous->config.destination;
        }
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err(std::move(valid.error()));
    }

    auto manifest = ChunkPlanner::plan(static_cast<std::int64_t>(config.file_size),
                                       static_cast<std::int64_t>(config.chunk_size));
    if (manifest.is_error()) {
        return Err(std::move(manifest.error()));
    }
    const std::size_t total_chunks = manifest.value().size();

    std::shared_ptr<ChunkReader> reader;
    if (config.source.kind != SourceKind::Local) {
        if (!reader_factory_) {
            return Err(make_error(ErrorCode::InvalidConfig,
                                  std::string("no reader available for ") + to_string(config.source.kind) +
                                      " sources"));
        }
        auto created = reader_factory_(config);
        if (created.is_error()) {
            return Err(std::move(created.error()));
        }
        reader = std::move(created.value());
    }

    config.job_id = next_job_id();
    config.created_at = std::chrono::system_clock::now();
    config.error_message.clear();
    config.started_at.reset();
    config.completed_at.reset();

    auto opened = ledger_.open(config.job_id, total_chunks, describe_job(config));
    if (opened.is_error()) {
        return Err(std::move(opened.error()));
    }

    if (previous) {
        std::lock_guard lock(previous->mutex);
        const auto& old = previous->config;
        auto fail = [&](UploadError error) {
            ledger_.purge(config.job_id);
            return error;
        };
        if (!previous->machine.failed_transiently() || !ledger_.contains(old.job_id)) {
            return Err(fail(make_error(ErrorCode::InvalidTransition,
                                       "job " + old.job_id + " cannot be resumed")));
        }
        if (old.file_size != config.file_size || old.chunk_size != config.chunk_size) {
            return Err(fail(make_error(ErrorCode::InvalidConfig,
                                       "file_size and chunk_size must match job " + old.job_id)));
        }

        auto adopted = ledger_.adopt(old.job_id, config.job_id);
        if (adopted.is_error()) {
            return Err(fail(std::move(adopted.error())));
        }
        auto moved = store_.adopt(old.job_id, config.job_id);
        if (moved.is_error()) {
            return Err(fail(std::move(moved.error())));
        }
        ledger_.purge(old.job_id);
        config.retry_count = old.retry_count + 1;
    }

    const std::string job_id = config.job_id;
    const std::uint64_t chunk_size = config.chunk_size;

    auto record = registry_.insert(std::move(config));
    if (!record) {
        ledger_.purge(job_id);
        return Err(make_error(ErrorCode::IoError, "job id collision for " + job_id));
    }
    admit(record, std::move(manifest.value()), std::move(reader));

    return Ok(InitiateResponse{job_id, JobStatus::Queued, chunk_size, total_chunks});
}

void UploadService::admit(const std::shared_ptr<JobRecord>& record, ChunkManifest manifest,
                          std::shared_ptr<ChunkReader> reader) {
    const std::size_t total_chunks = manifest.size();
    UploadJobConfig config;
    {
        std::lock_guard lock(record->mutex);
        record->manifest = std::move(manifest);
        config = record->config;
    }

    progress_.register_job(config.job_id, config.file_size, config.file_name,
                           ledger_.committed_bytes(config.job_id));
    bus_.emit(events::JobQueuedEvent{config.job_id, config.file_name, config.file_size, total_chunks,
                                     config.resume_from});

    std::lock_guard lock(record->mutex);
    arm_deadline_locked(record);
    // A resumed job may already hold every chunk; no further PUT will arrive.
    if (all_committed_locked(*record)) {
        auto activated = activate_locked(*record);
        if (activated.is_ok()) {
            schedule_processing_locked(record);
        }
    } else if (reader) {
        record->reader = std::move(reader);
        schedule_transfer_locked(record);
    }
}

std::size_t UploadService::recover() {
    std::size_t restored = 0;
    for (const auto& journaled : ledger_.journaled_jobs()) {
        if (stopping_.load()) {
            break;
        }
        if (registry_.find(journaled.job_id)) {
            continue;
        }
        if (journaled.total_chunks == 0) {
            discard_journal(journaled.job_id);
            continue;
        }

        auto config = restore_job(journaled.job_id, journaled.descriptor);
        if (config.is_error()) {
            discard_journal(journaled.job_id);
            continue;
        }
        if (validate(config.value()).is_error()) {
            discard_journal(journaled.job_id);
            continue;
        }
        auto manifest = ChunkPlanner::plan(static_cast<std::int64_t>(config.value().file_size),
                                           static_cast<std::int64_t>(config.value().chunk_size));
        if (manifest.is_error() || manifest.value().size() != journaled.total_chunks) {
            discard_journal(journaled.job_id);
            continue;
        }
        if (ledger_.open(journaled.job_id, journaled.total_chunks).is_error()) {
            discard_journal(journaled.job_id);
            continue;
        }

        // A pulled job whose source cannot be reopened is restored as FAILED with the
        // reason, so its status and resume info stay queryable.
        std::shared_ptr<ChunkReader> reader;
        std::optional<UploadError> reader_error;
        if (config.value().source.kind != SourceKind::Local) {
            if (!reader_factory_) {
                reader_error = make_error(ErrorCode::InvalidConfig,
                                          std::string("no reader available for ") +
                                              to_string(config.value().source.kind) + " sources");
            } else {
                auto created = reader_factory_(config.value());
                if (created.is_error()) {
                    reader_error = std::move(created.error());
                } else {
                    reader = std::move(created.value());
                }
            }
        }

        config.value().created_at = std::chrono::system_clock::now();
        auto record = registry_.insert(std::move(config.value()));
        if (!record) {
            continue;
        }
        admit(record, std::move(manifest.value()), std::move(reader));
        if (reader_error && !ledger_.missing(journaled.job_id).empty()) {
            fail_job(record, std::move(*reader_error));
        }
        restored++;
    }
    return restored;
}

void UploadService::discard_journal(const std::string& job_id) {
    ledger_.purge(job_id);
    store_.remove(job_id);
}

// ════════════════════════════════════════════════════════
// Chunk intake
// ════════════════════════════════════════════════════════

UploadResult<ChunkReceipt> UploadService::put_chunk(const std::string& job_id,
                                                    std::size_t index,
                                                    const std::vector<std::uint8_t>& data,
                                                    const std::string& checksum) {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    auto record = found.value();

    const std::string actual = checksum_hex(data);
    const std::string declared = lowercase(checksum);
    if (!declared.empty() && declared != actual) {
        return Err(make_error(ErrorCode::ChunkRejected,
                              "payload checksum " + actual + " does not match declared " + declared, index));
    }

    auto duplicate_receipt = [&]() {
        const auto snapshot = progress_.get_progress(job_id);
        return ChunkReceipt{true, true, actual, snapshot ? snapshot->bytes_uploaded : 0};
    };

    {
        std::lock_guard lock(record->mutex);
        auto admitted = check_intake_locked(*record, index, actual, data.size());
        if (admitted.is_error()) {
            return Err(std::move(admitted.error()));
        }
        if (admitted.value()) {
            return Ok(duplicate_receipt());
        }
    }

    auto staged = store_.stage(job_id, index, data);
    if (staged.is_error()) {
        return Err(std::move(staged.error()));
    }

    // Checked again: another PUT of this index or a cancel may have won meanwhile.
    bool first_commit = false;
    {
        std::lock_guard lock(record->mutex);
        auto admitted = check_intake_locked(*record, index, actual, data.size());
        if (admitted.is_error() || admitted.value()) {
            store_.discard(staged.value());
            if (admitted.is_error()) {
                return Err(std::move(admitted.error()));
            }
            return Ok(duplicate_receipt());
        }

        auto published = store_.publish(staged.value(), job_id, index);
        if (published.is_error()) {
            return Err(std::move(published.error()));
        }
        auto outcome = ledger_.commit(job_id, index, actual, data.size());
        if (outcome.is_error()) {
            std::error_code ec;
            std::filesystem::remove(store_.chunk_path(job_id, index), ec);
            return Err(std::move(outcome.error()));
        }
        first_commit = outcome.value() == CommitOutcome::Committed;
        if (first_commit) {
            progress_.add_bytes(job_id, data.size());
        }
    }

    if (first_commit) {
        bus_.emit(events::ChunkCommittedEvent{job_id, index, ledger_.total_chunks(job_id), data.size()});
        on_chunk_committed(record);
    }

    const auto snapshot = progress_.get_progress(job_id);
    return Ok(ChunkReceipt{true, !first_commit, actual, snapshot ? snapshot->bytes_uploaded : 0});
}

UploadResult<bool> UploadService::check_intake_locked(JobRecord& record, std::size_t index,
                                                      const std::string& checksum, std::size_t length) {
    if (index >= record.manifest.size()) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "chunk index " + std::to_string(index) + " is outside 0.." +
                                  std::to_string(record.manifest.size() - 1),
                              index));
    }

    if (auto existing = ledger_.checksum_of(record.config.job_id, index)) {
        if (*existing != checksum) {
            return Err(make_error(ErrorCode::IntegrityError,
                                  "chunk already committed with checksum " + *existing, index));
        }
        return Ok(true);
    }

    if (record.machine.state() == JobStatus::Queued) {
        auto activated = activate_locked(record);
        if (activated.is_error()) {
            return Err(std::move(activated.error()));
        }
    }
    if (record.machine.state() != JobStatus::Uploading) {
        return Err(make_error(ErrorCode::InvalidTransition,
                              std::string("job is ") + to_string(record.machine.state()) +
                                  "; chunks are accepted only while UPLOADING",
                              index));
    }

    const std::uint64_t expected = record.manifest[index].length;
    if (length != expected) {
        return Err(make_error(ErrorCode::ChunkRejected,
                              "chunk length " + std::to_string(length) + " != expected " +
                                  std::to_string(expected),
                              index));
    }
    return Ok(false);
}

void UploadService::on_chunk_committed(const std::shared_ptr<JobRecord>& record) {
    std::lock_guard lock(record->mutex);
    if (record->machine.state() == JobStatus::Uploading && all_committed_locked(*record)) {
        schedule_processing_locked(record);
    }
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

UploadResult<std::shared_ptr<JobRecord>> UploadService::lookup(const std::string& job_id) const {
    auto record = registry_.find(job_id);
    if (!record) {
        return Err(make_error(ErrorCode::NotFound, "job " + job_id + " not found"));
    }
    return Ok(std::move(record));
}

UploadResult<ResumeInfo> UploadService::resume_info(const std::string& job_id) const {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    std::lock_guard lock(record->mutex);
    ResumeInfo info;
    info.job_id = job_id;
    info.total_chunks = record->manifest.size();
    info.chunk_size = record->config.chunk_size;

    const bool has_ledger = ledger_.contains(job_id);
    if (has_ledger) {
        info.missing_chunks = ledger_.missing(job_id);
    } else {
        info.missing_chunks.reserve(info.total_chunks);
        for (std::size_t i = 0; i < info.total_chunks; ++i) {
            info.missing_chunks.push_back(i);
        }
    }
    info.can_resume = has_ledger && (!record->machine.terminal() || record->machine.failed_transiently());
    return Ok(std::move(info));
}

UploadResult<UploadProgress> UploadService::status(const std::string& job_id) const {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    if (auto snapshot = progress_.get_progress(job_id)) {
        return Ok(std::move(*snapshot));
    }

    const auto& record = found.value();
    std::lock_guard lock(record->mutex);
    UploadProgress progress;
    progress.job_id = job_id;
    progress.status = record->machine.state();
    progress.bytes_total = record->config.file_size;
    progress.current_file = record->config.file_name;
    progress.error_message = record->config.error_message;
    progress.last_updated = record->machine.last_transition();
    return Ok(std::move(progress));
}

UploadResult<ChunkStatus> UploadService::chunk_status(const std::string& job_id) const {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    ChunkStatus status;
    status.job_id = job_id;
    {
        std::lock_guard lock(record->mutex);
        status.total_chunks = record->manifest.size();
    }
    status.committed_chunks = ledger_.committed(job_id);
    status.complete = status.total_chunks > 0 && status.committed_chunks.size() == status.total_chunks;
    status.percentage = status.total_chunks == 0
                            ? 0.0
                            : 100.0 * static_cast<double>(status.committed_chunks.size()) /
                                  static_cast<double>(status.total_chunks);
    return Ok(std::move(status));
}

ServiceLimits UploadService::limits() const {
    ServiceLimits limits;
    limits.max_file_size = options_.max_file_size;
    limits.default_chunk_size = options_.default_chunk_size;
    limits.min_chunk_size = options_.min_chunk_size;
    limits.max_chunk_size = options_.max_chunk_size;
    limits.default_timeout = options_.default_timeout;
    limits.retention = options_.retention;
    limits.max_workers = options_.max_workers;
    limits.max_concurrent_jobs = options_.max_concurrent_jobs;
    limits.source_types = {"local", "google_drive", "s3", "dropbox", "onedrive", "url"};
    for (auto sensor : {SensorType::IDX, SensorType::TIFF, SensorType::TIFF_RGB, SensorType::NETCDF,
                        SensorType::HDF5, SensorType::NEXUS_4D, SensorType::RGB, SensorType::MAPIR,
                        SensorType::OTHER}) {
        limits.sensors.emplace_back(to_string(sensor));
    }
    return limits;
}

ServiceHealth UploadService::health() const {
    ServiceHealth health;
    for (const auto& record : registry_.snapshot()) {
        std::lock_guard lock(record->mutex);
        if (!record->machine.terminal()) {
            health.active_jobs++;
        }
        health.total_jobs++;
    }
    return health;
}

// ════════════════════════════════════════════════════════
// Control
// ════════════════════════════════════════════════════════

UploadResult<JobStatus> UploadService::cancel(const std::string& job_id) {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    {
        std::lock_guard lock(record->mutex);
        const JobStatus state = record->machine.state();
        if (is_terminal(state)) {
            return Ok(state);
        }
        if (record->processing_scheduled || all_committed_locked(*record)) {
            return Err(make_error(ErrorCode::InvalidTransition,
                                  "every chunk is committed; the job can no longer be cancelled"));
        }
        auto applied = apply_locked(*record, JobEvent::Cancel);
        if (applied.is_error()) {
            return Err(std::move(applied.error()));
        }
        record->token.cancel();
        bus_.emit(events::JobCancelledEvent{job_id});
    }

    store_.remove(job_id);
    return Ok(JobStatus::Cancelled);
}

UploadResult<JobStatus> UploadService::pause(const std::string& job_id) {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    std::lock_guard lock(record->mutex);
    const JobStatus state = record->machine.state();
    if (is_terminal(state)) {
        return Ok(state);
    }
    if (record->processing_scheduled) {
        return Err(make_error(ErrorCode::InvalidTransition, "job is already processing"));
    }
    auto applied = apply_locked(*record, JobEvent::Pause);
    if (applied.is_error()) {
        return Err(std::move(applied.error()));
    }
    record->token.cancel();
    return Ok(JobStatus::Paused);
}

UploadResult<JobStatus> UploadService::resume(const std::string& job_id) {
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    std::lock_guard lock(record->mutex);
    auto applied = apply_locked(*record, JobEvent::Resume);
    if (applied.is_error()) {
        return Err(std::move(applied.error()));
    }

    // The last chunk may have landed while the job was paused.
    if (all_committed_locked(*record)) {
        schedule_processing_locked(record);
    } else if (record->reader) {
        schedule_transfer_locked(record);
    }
    return Ok(JobStatus::Uploading);
}

UploadResult<void> UploadService::start_transfer(const std::string& job_id,
                                                 std::shared_ptr<ChunkReader> reader) {
    if (!reader) {
        return Err(make_error(ErrorCode::InvalidConfig, "start_transfer needs a reader"));
    }
    auto found = lookup(job_id);
    if (found.is_error()) {
        return Err(std::move(found.error()));
    }
    const auto& record = found.value();

    std::lock_guard lock(record->mutex);
    const JobStatus state = record->machine.state();
    if (record->machine.terminal()) {
        return Err(make_error(ErrorCode::InvalidTransition,
                              std::string("job is ") + to_string(state)));
    }
    record->reader = std::move(reader);
    if (state == JobStatus::Queued || state == JobStatus::Uploading) {
        schedule_transfer_locked(record);
    }
    return Ok();
}

std::size_t UploadService::enforce_timeouts() {
    const auto now = std::chrono::steady_clock::now();
    std::size_t failed = 0;
    for (const auto& record : registry_.snapshot()) {
        std::lock_guard lock(record->mutex);
        if (expire_locked(*record, now)) {
            failed++;
        }
    }
    return failed;
}

std::size_t UploadService::evict_terminal_jobs(std::chrono::milliseconds retention) {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> expired;
    for (const auto& record : registry_.snapshot()) {
        std::lock_guard lock(record->mutex);
        if (record->machine.terminal() && !record->transfer_running &&
            now - record->finished_at >= retention) {
            expired.push_back(record->config.job_id);
        }
    }

    for (const auto& job_id : expired) {
        registry_.erase(job_id);
        ledger_.purge(job_id);
        progress_.remove(job_id);
        store_.remove(job_id);
    }
    return expired.size();
}

std::size_t UploadService::evict_terminal_jobs() {
    return evict_terminal_jobs(options_.retention);
}

void UploadService::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    for (const auto& record : registry_.snapshot()) {
        record->token.cancel();
    }
    {
        std::lock_guard lock(deadline_mutex_);
        for (auto& [job_id, timer] : deadlines_) {
            timer->cancel();
        }
        deadlines_.clear();
    }
    deadline_pool_.join();
    executor_.join();
}

// ════════════════════════════════════════════════════════
// Lifecycle helpers
// ════════════════════════════════════════════════════════

bool UploadService::all_committed_locked(const JobRecord& record) const {
    return !record.manifest.empty() &&
           ledger_.committed_count(record.config.job_id) == record.manifest.size();
}

void UploadService::after_transition_locked(JobRecord& record, JobStatus from) {
    const JobStatus to = record.machine.state();
    if (to == JobStatus::Initializing && !record.config.started_at) {
        record.config.started_at = std::chrono::system_clock::now();
    }
    if (is_terminal(to)) {
        record.config.completed_at = std::chrono::system_clock::now();
        record.finished_at = std::chrono::steady_clock::now();
        disarm_deadline(record.config.job_id);
    }
    progress_.set_status(record.config.job_id, to, record.config.error_message);
    bus_.emit(events::JobStateChangedEvent{record.config.job_id, from, to});
}

UploadResult<JobStatus> UploadService::apply_locked(JobRecord& record, JobEvent event) {
    const JobStatus from = record.machine.state();
    auto applied = record.machine.apply(event);
    if (applied.is_ok()) {
        after_transition_locked(record, from);
    }
    return applied;
}

UploadResult<JobStatus> UploadService::fail_locked(JobRecord& record, UploadError error) {
    const JobStatus from = record.machine.state();
    auto failed = record.machine.fail(error);
    if (failed.is_error()) {
        return failed;
    }
    record.config.error_message = error.describe();
    record.token.cancel();
    after_transition_locked(record, from);
    bus_.emit(events::JobFailedEvent{record.config.job_id, std::move(error)});
    return failed;
}

UploadResult<JobStatus> UploadService::activate_locked(JobRecord& record) {
    auto picked = apply_locked(record, JobEvent::PickUp);
    if (picked.is_error()) {
        return picked;
    }
    return apply_locked(record, JobEvent::ManifestReady);
}

bool UploadService::expire_locked(JobRecord& record, std::chrono::steady_clock::time_point now) {
    if (record.machine.terminal() || now - record.accepted_at < record.config.timeout) {
        return false;
    }
    auto outcome = fail_locked(record, make_error(ErrorCode::TimeoutExceeded,
                                                  "job exceeded its timeout of " +
                                                      std::to_string(record.config.timeout.count()) + " ms"));
    return outcome.is_ok();
}

void UploadService::arm_deadline_locked(const std::shared_ptr<JobRecord>& record) {
    std::lock_guard lock(deadline_mutex_);
    if (stopping_.load()) {
        return;
    }
    auto timer = std::make_unique<boost::asio::steady_timer>(deadline_pool_);
    timer->expires_at(record->accepted_at + record->config.timeout);

    std::weak_ptr<JobRecord> weak = record;
    timer->async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto job = weak.lock()) {
            std::lock_guard job_lock(job->mutex);
            expire_locked(*job, std::chrono::steady_clock::now());
        }
    });
    deadlines_[record->config.job_id] = std::move(timer);
}

void UploadService::disarm_deadline(const std::string& job_id) {
    std::unique_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard lock(deadline_mutex_);
        auto it = deadlines_.find(job_id);
        if (it == deadlines_.end()) {
            return;
        }
        timer = std::move(it->second);
        deadlines_.erase(it);
    }
    timer->cancel();
}

void UploadService::schedule_processing_locked(const std::shared_ptr<JobRecord>& record) {
    if (record->processing_scheduled || stopping_.load()) {
        return;
    }
    record->processing_scheduled = true;
    boost::asio::post(executor_, [this, record]() { run_processing(record); });
}

void UploadService::schedule_transfer_locked(const std::shared_ptr<JobRecord>& record) {
    if (record->transfer_running || stopping_.load()) {
        return;
    }
    record->transfer_running = true;
    boost::asio::post(executor_, [this, record]() { run_transfer(record); });
}

void UploadService::fail_job(const std::shared_ptr<JobRecord>& record, UploadError error) {
    std::lock_guard lock(record->mutex);
    if (!record->machine.terminal()) {
        fail_locked(*record, std::move(error));
    }
}

// ════════════════════════════════════════════════════════
// Executor tasks
// ════════════════════════════════════════════════════════

void UploadService::run_transfer(const std::shared_ptr<JobRecord>& record) {
    std::string job_id;
    ChunkManifest manifest;
    RetryPolicy retry;
    std::shared_ptr<ChunkReader> reader;
    {
        std::lock_guard lock(record->mutex);
        if (stopping_.load()) {
            record->transfer_running = false;
            return;
        }
        if (record->machine.state() == JobStatus::Queued) {
            auto activated = activate_locked(*record);
            if (activated.is_error()) {
                record->transfer_running = false;
                return;
            }
        }
        if (record->machine.state() != JobStatus::Uploading) {
            record->transfer_running = false;
            return;
        }
        record->token.reset();
        job_id = record->config.job_id;
        manifest = record->manifest;
        retry = record->config.retry;
        reader = record->reader;
    }

    const auto committed = ledger_.committed(job_id);
    const std::set<std::size_t> already(committed.begin(), committed.end());

    LocalTransport transport(*this);
    TransferWorkerPool pool(options_.max_workers, retry, *reader, transport, ledger_, progress_, &bus_);
    auto result = pool.upload(job_id, manifest, already, record->token);

    std::lock_guard lock(record->mutex);
    record->transfer_running = false;
    if (result.is_ok()) {
        return;
    }

    const bool uploading = record->machine.state() == JobStatus::Uploading;
    const bool interrupted =
        result.error().code == ErrorCode::CancelledByUser || record->token.cancelled();
    if (interrupted) {
        // Paused and resumed again before this run wound down.
        if (uploading && !stopping_.load() && !all_committed_locked(*record)) {
            schedule_transfer_locked(record);
        }
        return;
    }
    if (uploading && !record->processing_scheduled) {
        fail_locked(*record, std::move(result.error()));
    }
}

void UploadService::run_processing(const std::shared_ptr<JobRecord>& record) {
    UploadJobConfig config;
    ChunkManifest manifest;
    {
        std::lock_guard lock(record->mutex);
        if (record->machine.state() != JobStatus::Uploading) {
            return;
        }
        if (apply_locked(*record, JobEvent::AllChunksCommitted).is_error()) {
            return;
        }
        config = record->config;
        manifest = record->manifest;
    }

    const fs::path destination = output_path(config);
    auto assembled = store_.assemble(config.job_id, manifest, destination);
    if (assembled.is_error()) {
        fail_job(record, std::move(assembled.error()));
        return;
    }
    const std::string file_checksum = assembled.value();

    if (config.auto_convert) {
        ConversionRequest request{config.job_id, config.dataset_id, destination,
                                  destination.parent_path(), config.sensor};
        const ConversionOutcome outcome = dispatcher_.dispatch(request);
        if (!outcome.success) {
            fail_job(record, make_error(ErrorCode::ConversionFailed, outcome.message));
            return;
        }
    }

    {
        std::lock_guard lock(record->mutex);
        if (apply_locked(*record, JobEvent::ConverterInvoked).is_error()) {
            return;
        }
    }

    if (config.verify_checksum && config.file_checksum && *config.file_checksum != file_checksum) {
        fail_job(record, make_error(ErrorCode::IntegrityError,
                                    "assembled file checksum " + file_checksum +
                                        " does not match expected " + *config.file_checksum));
        return;
    }

    std::chrono::milliseconds duration{0};
    {
        std::lock_guard lock(record->mutex);
        if (apply_locked(*record, JobEvent::Verified).is_error()) {
            return;
        }
        duration = std::chrono::duration_cast<std::chrono::milliseconds>(record->finished_at -
                                                                         record->accepted_at);
    }

    store_.remove(config.job_id);
    bus_.emit(events::JobCompletedEvent{config.job_id, destination.string(), file_checksum,
                                        config.file_size, duration});
}

} // namespace scingest::upload
