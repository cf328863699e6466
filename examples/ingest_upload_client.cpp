/**
 * @file ingest_upload_client.cpp
 * @brief Chunked, resumable upload of one local file to an ingest server
 *
 * USAGE:
 *   scingest_upload FILE --dataset ID [--server http://host:port]
 *                   [--chunk-mb N] [--workers N] [--sensor NAME]
 *                   [--no-convert] [--resume JOB_ID]
 *
 * With --resume the client asks the server what is missing and sends only
 * that. A FAILED job is continued under a new job id; a PAUSED one is
 * resumed in place. Ctrl+C stops the workers; run again with --resume.
 */

#include "scingest/api/upload_client.hpp"
#include "scingest/core/checksum.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"
#include "scingest/network/http_client.hpp"
#include "scingest/observability/logging.hpp"
#include "scingest/upload/cancellation.hpp"
#include "scingest/upload/chunk_planner.hpp"
#include "scingest/upload/chunk_transport.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"
#include "scingest/upload/transfer_worker_pool.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>

using namespace scingest;
using namespace scingest::upload;

namespace fs = std::filesystem;

namespace {

struct CommandLine {
    fs::path file;
    std::string dataset_id;
    std::string server = "http://localhost:5001";
    double chunk_mb = 64;
    std::size_t workers = 4;
    SensorType sensor = SensorType::OTHER;
    bool convert = true;
    std::optional<std::string> resume_job;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " FILE --dataset ID [--server http://host:port] [--chunk-mb N]"
                 " [--workers N] [--sensor NAME] [--no-convert] [--resume JOB_ID]\n";
}

Result<CommandLine, std::string> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--no-convert") {
            cmd.convert = false;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            if (!cmd.file.empty()) {
                return Err("more than one file given: " + arg);
            }
            cmd.file = arg;
            continue;
        }
        if (i + 1 >= argc) {
            return Err("missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--dataset") {
            cmd.dataset_id = value;
        } else if (arg == "--server") {
            cmd.server = value;
        } else if (arg == "--chunk-mb") {
            char* end = nullptr;
            cmd.chunk_mb = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || cmd.chunk_mb <= 0) {
                return Err("invalid --chunk-mb: " + value);
            }
        } else if (arg == "--workers") {
            char* end = nullptr;
            const long workers = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || workers <= 0) {
                return Err("invalid --workers: " + value);
            }
            cmd.workers = static_cast<std::size_t>(workers);
        } else if (arg == "--sensor") {
            auto sensor = sensor_from_string(value);
            if (!sensor) {
                return Err("unknown sensor: " + value);
            }
            cmd.sensor = *sensor;
        } else if (arg == "--resume") {
            cmd.resume_job = value;
        } else {
            return Err("unknown option " + arg);
        }
    }
    if (cmd.file.empty()) {
        return Err(std::string("no file given"));
    }
    if (cmd.dataset_id.empty() && !cmd.resume_job) {
        return Err(std::string("--dataset is required"));
    }
    return Ok(std::move(cmd));
}

// Settles which job receives the chunks and how it is laid out.
UploadResult<InitiateResponse> open_job(const api::UploadClient& client,
                                        const CommandLine& cmd,
                                        const UploadJobConfig& config) {
    if (!cmd.resume_job) {
        return client.initiate(config);
    }

    auto status = client.status(*cmd.resume_job);
    if (status.is_error()) {
        return Err(std::move(status.error()));
    }

    if (status.value().status == JobStatus::Failed) {
        UploadJobConfig continued = config;
        continued.resume_from = *cmd.resume_job;
        continued.file_size = 0;
        continued.chunk_size = 0;
        spdlog::info("Job {} failed ({}); continuing it under a new job",
                     *cmd.resume_job, status.value().error_message);
        return client.initiate(continued);
    }

    if (status.value().status == JobStatus::Paused) {
        auto resumed = client.resume(*cmd.resume_job);
        if (resumed.is_error()) {
            return Err(std::move(resumed.error()));
        }
    } else if (is_terminal(status.value().status)) {
        return Err(make_error(ErrorCode::InvalidTransition,
                              "job " + *cmd.resume_job + " is already " +
                                  to_string(status.value().status)));
    }

    InitiateResponse existing;
    existing.job_id = *cmd.resume_job;
    existing.status = status.value().status;
    return Ok(std::move(existing));
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_command_line(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    const CommandLine cmd = std::move(parsed.value());

    configure_logging(LoggingConfig{});

    auto url = network::parse_http_url(cmd.server);
    if (url.is_error()) {
        spdlog::error("Bad --server: {}", url.error());
        return 2;
    }

    std::error_code ec;
    const auto file_size = fs::file_size(cmd.file, ec);
    if (ec) {
        spdlog::error("Cannot stat {}: {}", cmd.file.string(), ec.message());
        return 1;
    }

    spdlog::info("Hashing {} ({} bytes)...", cmd.file.string(), file_size);
    auto file_checksum = checksum_file(cmd.file);
    if (file_checksum.is_error()) {
        spdlog::error("{}", file_checksum.error().describe());
        return 1;
    }

    UploadJobConfig config;
    config.source = SourceDescriptor{SourceKind::Local, cmd.file.string()};
    config.dataset_id = cmd.dataset_id;
    config.file_name = cmd.file.filename().string();
    config.file_size = file_size;
    config.chunk_size = static_cast<std::uint64_t>(cmd.chunk_mb * 1024 * 1024);
    config.file_checksum = file_checksum.value();
    config.sensor = cmd.sensor;
    config.auto_convert = cmd.convert;
    config.retry.retry_delay = std::chrono::seconds(2);

    api::UploadClient client(network::HttpClient(url.value().host, url.value().port));

    auto job = open_job(client, cmd, config);
    if (job.is_error()) {
        spdlog::error("Cannot start upload: {}", job.error().describe());
        return 1;
    }
    const std::string job_id = job.value().job_id;

    auto resume = client.resume_info(job_id);
    if (resume.is_error()) {
        spdlog::error("Cannot read resume state of {}: {}", job_id, resume.error().describe());
        return 1;
    }

    // A resumed job keeps its server-side chunk size.
    const std::uint64_t chunk_size = resume.value().chunk_size;

    auto manifest = ChunkPlanner::plan(static_cast<std::int64_t>(file_size),
                                       static_cast<std::int64_t>(chunk_size));
    if (manifest.is_error()) {
        spdlog::error("{}", manifest.error().describe());
        return 1;
    }
    if (manifest.value().size() != resume.value().total_chunks) {
        spdlog::error("Server expects {} chunks but the file splits into {}",
                      resume.value().total_chunks, manifest.value().size());
        return 1;
    }

    std::set<std::size_t> already_committed;
    for (std::size_t i = 0; i < manifest.value().size(); ++i) {
        already_committed.insert(i);
    }
    std::uint64_t committed_bytes = 0;
    for (std::size_t missing : resume.value().missing_chunks) {
        already_committed.erase(missing);
    }
    for (std::size_t index : already_committed) {
        committed_bytes += manifest.value()[index].length;
    }

    spdlog::info("Job {}: {} chunks of {} bytes, {} already on the server",
                 job_id, manifest.value().size(), chunk_size, already_committed.size());

    // ────────────────────────────────────────────────────────
    // Transfer
    // ────────────────────────────────────────────────────────

    events::EventBus bus;
    ResumeLedger ledger;
    ProgressAggregator progress(&bus);
    if (auto opened = ledger.open(job_id, manifest.value().size()); opened.is_error()) {
        spdlog::error("{}", opened.error().describe());
        return 1;
    }
    progress.register_job(job_id, file_size, config.file_name, committed_bytes);

    bus.subscribe<events::ChunkCommittedEvent>([&progress](const events::ChunkCommittedEvent& e) {
        if (auto snapshot = progress.get_progress(e.job_id)) {
            spdlog::info("chunk {}/{} committed  {:.1f}%  {:.2f} MB/s  eta {:.0f}s",
                         e.chunk_index + 1, e.total_chunks, snapshot->progress_percentage,
                         snapshot->speed_mbps, snapshot->eta_seconds);
        }
    });
    bus.subscribe<events::ChunkRetryEvent>([](const events::ChunkRetryEvent& e) {
        spdlog::warn("chunk {} attempt {} failed ({}); retrying in {}ms",
                     e.chunk_index, e.attempt, e.reason, e.delay.count());
    });

    CancellationToken token;
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&token, &job_id](const boost::system::error_code& error, int) {
        if (!error) {
            spdlog::warn("Interrupted; resume later with --resume {}", job_id);
            token.cancel();
        }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    FileChunkReader reader(cmd.file);
    api::HttpChunkTransport transport(client);
    TransferWorkerPool pool(cmd.workers, config.retry, reader, transport, ledger, progress, &bus);
    auto report = pool.upload(job_id, manifest.value(), already_committed, token);

    signal_context.stop();
    signal_thread.join();

    if (report.is_error()) {
        spdlog::error("Upload of {} stopped: {}", job_id, report.error().describe());
        return 1;
    }
    spdlog::info("Sent {} chunks ({} bytes, {} retries, {} skipped)",
                 report.value().chunks_uploaded, report.value().bytes_uploaded,
                 report.value().retries, report.value().chunks_skipped);

    // ────────────────────────────────────────────────────────
    // Wait for server-side processing
    // ────────────────────────────────────────────────────────

    for (;;) {
        auto status = client.status(job_id);
        if (status.is_error()) {
            spdlog::error("Status query failed: {}", status.error().describe());
            return 1;
        }
        if (is_terminal(status.value().status)) {
            if (status.value().status == JobStatus::Completed) {
                spdlog::info("Job {} completed", job_id);
                shutdown_logging();
                return 0;
            }
            spdlog::error("Job {} ended {}: {}", job_id, to_string(status.value().status),
                          status.value().error_message);
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}
