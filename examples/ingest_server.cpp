/**
 * @file ingest_server.cpp
 * @brief Ingest server: upload API on Boost.Asio
 *
 * USAGE:
 *   scingest_server [--config FILE] [--host HOST] [--port N]
 *                   [--data-dir DIR] [--staging-dir DIR] [--threads N]
 *
 * Command-line flags win over environment variables, which win over the
 * config file.
 */

#include "scingest/api/upload_client.hpp"
#include "scingest/api/upload_routes.hpp"
#include "scingest/config/service_config.hpp"
#include "scingest/events/components.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"
#include "scingest/network/http_client.hpp"
#include "scingest/network/http_router.hpp"
#include "scingest/network/http_server_asio.hpp"
#include "scingest/observability/logging.hpp"
#include "scingest/upload/chunk_store.hpp"
#include "scingest/upload/conversion.hpp"
#include "scingest/upload/job_registry.hpp"
#include "scingest/upload/job_watchdog.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"
#include "scingest/upload/upload_service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace scingest;
using namespace scingest::network;
using namespace scingest::upload;

namespace {

struct CommandLine {
    std::filesystem::path config_path;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::filesystem::path> data_dir;
    std::optional<std::filesystem::path> staging_dir;
    std::size_t threads = std::max(4u, std::thread::hardware_concurrency());
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--host HOST] [--port N] [--data-dir DIR]"
                 " [--staging-dir DIR] [--threads N]\n";
}

Result<CommandLine, std::string> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            return Err("missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            cmd.config_path = value;
        } else if (arg == "--host") {
            cmd.host = value;
        } else if (arg == "--port" || arg == "--threads") {
            char* end = nullptr;
            const long number = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || number <= 0 ||
                (arg == "--port" && number > 65535)) {
                return Err("invalid value for " + arg + ": " + value);
            }
            if (arg == "--port") {
                cmd.port = static_cast<std::uint16_t>(number);
            } else {
                cmd.threads = static_cast<std::size_t>(number);
            }
        } else if (arg == "--data-dir") {
            cmd.data_dir = value;
        } else if (arg == "--staging-dir") {
            cmd.staging_dir = value;
        } else {
            return Err("unknown option " + arg);
        }
    }
    return Ok(std::move(cmd));
}

// Url sources are fetched with ranged GETs; cloud providers need connectors
// this server does not ship.
UploadService::ReaderFactory make_reader_factory() {
    return [](const UploadJobConfig& config) -> UploadResult<std::shared_ptr<ChunkReader>> {
        if (config.source.kind != SourceKind::Url) {
            return Err(make_error(ErrorCode::InvalidConfig,
                                  std::string("no connector configured for source kind '") +
                                      to_string(config.source.kind) + "'"));
        }
        auto url = parse_http_url(config.source.location);
        if (url.is_error()) {
            return Err(make_error(ErrorCode::InvalidConfig, url.error()));
        }
        return Ok(std::make_shared<api::HttpRangeReader>(url.value(), config.retry.chunk_timeout));
    };
}

const SensorType kAllSensors[] = {
    SensorType::IDX,      SensorType::TIFF, SensorType::TIFF_RGB,
    SensorType::NETCDF,   SensorType::HDF5, SensorType::NEXUS_4D,
    SensorType::RGB,      SensorType::MAPIR, SensorType::OTHER,
};

} // namespace

int main(int argc, char* argv[]) {
    auto cmd = parse_command_line(argc, argv);
    if (cmd.is_error()) {
        std::cerr << cmd.error() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = load_config(cmd.value().config_path);
    if (loaded.is_error()) {
        std::cerr << "Configuration error: " << loaded.error() << "\n";
        return 2;
    }
    ServiceConfig config = std::move(loaded.value());
    if (cmd.value().host) config.server.host = *cmd.value().host;
    if (cmd.value().port) config.server.port = *cmd.value().port;
    if (cmd.value().data_dir) config.data_dir = *cmd.value().data_dir;
    if (cmd.value().staging_dir) config.staging_dir = *cmd.value().staging_dir;

    configure_logging(config.logging);

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("scingest ingest server");
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Destination root: {}", config.data_dir.string());
    spdlog::info("Staging area:     {}", config.staging_dir.string());
    spdlog::info("Ledger journals:  {}", config.effective_ledger_dir().string());

    // ────────────────────────────────────────────────────────
    // Upload core
    // ────────────────────────────────────────────────────────

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    ResumeLedger ledger(config.effective_ledger_dir());
    ChunkStore store(config.staging_dir);
    ProgressAggregator progress(&bus);
    JobRegistry registry;

    ConverterRegistry converters;
    if (config.converter_command.empty()) {
        spdlog::warn("No conversion.command configured; jobs with convert=true will fail");
    } else {
        for (SensorType sensor : kAllSensors) {
            converters.register_converter(sensor, make_command_converter(config.converter_command));
        }
        spdlog::info("Converter command: {}", config.converter_command);
    }

    UploadService service(config.service_options(), registry, ledger, progress, store, converters, bus);
    service.set_reader_factory(make_reader_factory());
    const std::size_t recovered = service.recover();
    if (recovered > 0) {
        spdlog::info("Recovered {} interrupted upload(s) from the ledger journals", recovered);
    }

    JobWatchdog watchdog(service, config.watchdog_interval);

    // ────────────────────────────────────────────────────────
    // HTTP
    // ────────────────────────────────────────────────────────

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    api::register_upload_routes(router, service);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }

    try {
        boost::asio::io_context io_context;

        // A chunk PUT carries up to max_chunk_size bytes of payload.
        const std::size_t max_body = static_cast<std::size_t>(config.max_chunk_size) + 1024 * 1024;
        HttpServerAsio server(io_context, config.server.host, config.server.port, max_body);
        server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
            server.stop();
            io_context.stop();
        });

        watchdog.start();
        bus.emit(events::ServerStartedEvent{server.get_port()});
        spdlog::info("Serving on http://{}:{} with {} threads",
                     config.server.host, server.get_port(), cmd.value().threads);

        std::vector<std::thread> threads;
        for (std::size_t i = 1; i < cmd.value().threads; ++i) {
            threads.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& thread : threads) {
            thread.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        watchdog.stop();
        service.shutdown();
        shutdown_logging();
        return 1;
    }

    watchdog.stop();
    service.shutdown();
    metrics.print_stats();
    spdlog::info("Server shut down cleanly");
    shutdown_logging();
    return 0;
}
