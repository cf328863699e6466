#pragma once

#include "scingest/core/result.hpp"
#include "scingest/upload/types.hpp"
#include "scingest/upload/upload_service.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scingest {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    std::uint16_t port = 5001;
};

/**
 * @brief Everything the ingest server reads at startup
 *
 * FILE FORMAT (every key optional):
 * {
 *   "server":  {"host": "0.0.0.0", "port": 5001},
 *   "logging": {"level": "info", "pattern": "[%H:%M:%S] [%^%l%$] %v"},
 *   "storage": {"data_dir": "...", "staging_dir": "...", "ledger_dir": "..."},
 *   "upload":  {"chunk_size_mb": 64, "min_chunk_size_mb": 1, "max_chunk_size_mb": 1024,
 *               "max_file_size_gb": 10240, "max_workers": 4, "max_concurrent_jobs": 2,
 *               "max_retries": 3, "retry_delay_seconds": 30, "backoff": "exponential",
 *               "timeout_minutes": 120, "chunk_timeout_seconds": 300},
 *   "jobs":    {"retention_days": 7, "watchdog_interval_seconds": 30},
 *   "conversion": {"command": "/opt/scingest/bin/convert"}
 * }
 *
 * ENVIRONMENT (wins over the file):
 * SCINGEST_DATA_DIR, SCINGEST_STAGING_DIR, SCINGEST_PORT
 * (log level and pattern overrides are resolved by configure_logging)
 */
struct ServiceConfig {
    ServerConfig server;
    LoggingConfig logging;

    std::filesystem::path data_dir = "./data/datasets";   ///< Destination root
    std::filesystem::path staging_dir = "./data/staging";
    std::filesystem::path ledger_dir;                     ///< Empty: <staging_dir>/ledger

    std::uint64_t chunk_size = 64ULL * 1024 * 1024;
    std::uint64_t min_chunk_size = 1ULL * 1024 * 1024;
    std::uint64_t max_chunk_size = 1024ULL * 1024 * 1024;
    std::uint64_t max_file_size = 10ULL * 1024 * 1024 * 1024 * 1024;
    std::size_t max_workers = 4;
    std::size_t max_concurrent_jobs = 2;
    upload::RetryPolicy retry;
    std::chrono::milliseconds timeout{std::chrono::minutes(120)};
    std::chrono::milliseconds retention{std::chrono::hours(24 * 7)};
    std::chrono::milliseconds watchdog_interval{std::chrono::seconds(30)};

    std::string converter_command;  ///< Empty: no converter, convert=true jobs fail

    [[nodiscard]] std::filesystem::path effective_ledger_dir() const;
    [[nodiscard]] upload::ServiceOptions service_options() const;
};

/**
 * @brief Build a config from parsed JSON on top of the defaults
 *
 * Fails with a readable message on a wrongly typed or out-of-range value.
 */
Result<ServiceConfig, std::string> parse_config(const nlohmann::json& document);

/**
 * @brief Read `path` (if not empty), then apply environment overrides
 */
Result<ServiceConfig, std::string> load_config(const std::filesystem::path& path);

Result<void, std::string> apply_env_overrides(ServiceConfig& config);

} // namespace scingest
