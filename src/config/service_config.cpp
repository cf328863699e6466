#include "scingest/config/service_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace scingest {

using json = nlohmann::json;

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

// Reads section[key] into `out` when present; type mismatches become errors.
template<typename T>
Result<void, std::string> read_key(const json& section, const char* section_name, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        return Err(std::string(section_name) + "." + key + ": " + e.what());
    }
    return Ok();
}

Result<void, std::string> require_positive(double value, const char* name) {
    if (value <= 0) {
        return Err(std::string(name) + " must be positive");
    }
    return Ok();
}

} // namespace

std::filesystem::path ServiceConfig::effective_ledger_dir() const {
    return ledger_dir.empty() ? staging_dir / "ledger" : ledger_dir;
}

upload::ServiceOptions ServiceConfig::service_options() const {
    upload::ServiceOptions options;
    options.destination_root = data_dir;
    options.max_file_size = max_file_size;
    options.default_chunk_size = chunk_size;
    options.min_chunk_size = min_chunk_size;
    options.max_chunk_size = max_chunk_size;
    options.max_workers = max_workers;
    options.max_concurrent_jobs = max_concurrent_jobs;
    options.default_retry = retry;
    options.default_timeout = timeout;
    options.retention = retention;
    return options;
}

Result<ServiceConfig, std::string> parse_config(const json& document) {
    ServiceConfig config;
    if (!document.is_object()) {
        return Err(std::string("configuration root must be a JSON object"));
    }

    const json empty = json::object();
    auto section = [&](const char* name) -> const json& {
        auto it = document.find(name);
        return it != document.end() && it->is_object() ? *it : empty;
    };

    // server
    {
        const json& s = section("server");
        int port = config.server.port;
        auto read = first_error({read_key(s, "server", "host", config.server.host),
                                 read_key(s, "server", "port", port)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        if (port <= 0 || port > 65535) {
            return Err("server.port out of range: " + std::to_string(port));
        }
        config.server.port = static_cast<std::uint16_t>(port);
    }

    // logging
    {
        const json& s = section("logging");
        auto read = first_error({read_key(s, "logging", "level", config.logging.level),
                                 read_key(s, "logging", "pattern", config.logging.pattern)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
    }

    // storage
    {
        const json& s = section("storage");
        std::string data_dir = config.data_dir.string();
        std::string staging_dir = config.staging_dir.string();
        std::string ledger_dir;
        auto read = first_error({read_key(s, "storage", "data_dir", data_dir),
                                 read_key(s, "storage", "staging_dir", staging_dir),
                                 read_key(s, "storage", "ledger_dir", ledger_dir)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        config.data_dir = data_dir;
        config.staging_dir = staging_dir;
        config.ledger_dir = ledger_dir;
    }

    // upload
    {
        const json& s = section("upload");
        double chunk_mb = static_cast<double>(config.chunk_size) / kMiB;
        double min_chunk_mb = static_cast<double>(config.min_chunk_size) / kMiB;
        double max_chunk_mb = static_cast<double>(config.max_chunk_size) / kMiB;
        double max_file_gb = static_cast<double>(config.max_file_size) / kGiB;
        int max_workers = static_cast<int>(config.max_workers);
        int max_jobs = static_cast<int>(config.max_concurrent_jobs);
        double retry_delay_s = config.retry.retry_delay.count() / 1000.0;
        double timeout_min = config.timeout.count() / 60000.0;
        double chunk_timeout_s = config.retry.chunk_timeout.count() / 1000.0;
        std::string backoff = upload::to_string(config.retry.backoff);

        auto read = first_error({read_key(s, "upload", "chunk_size_mb", chunk_mb),
                                 read_key(s, "upload", "min_chunk_size_mb", min_chunk_mb),
                                 read_key(s, "upload", "max_chunk_size_mb", max_chunk_mb),
                                 read_key(s, "upload", "max_file_size_gb", max_file_gb),
                                 read_key(s, "upload", "max_workers", max_workers),
                                 read_key(s, "upload", "max_concurrent_jobs", max_jobs),
                                 read_key(s, "upload", "max_retries", config.retry.max_retries),
                                 read_key(s, "upload", "retry_delay_seconds", retry_delay_s),
                                 read_key(s, "upload", "backoff", backoff),
                                 read_key(s, "upload", "timeout_minutes", timeout_min),
                                 read_key(s, "upload", "chunk_timeout_seconds", chunk_timeout_s)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }

        auto positive = first_error({require_positive(chunk_mb, "upload.chunk_size_mb"),
                                     require_positive(min_chunk_mb, "upload.min_chunk_size_mb"),
                                     require_positive(max_file_gb, "upload.max_file_size_gb"),
                                     require_positive(max_workers, "upload.max_workers"),
                                     require_positive(max_jobs, "upload.max_concurrent_jobs"),
                                     require_positive(timeout_min, "upload.timeout_minutes"),
                                     require_positive(chunk_timeout_s, "upload.chunk_timeout_seconds")});
        if (positive.is_error()) {
            return Err(std::move(positive.error()));
        }
        if (min_chunk_mb > max_chunk_mb || chunk_mb < min_chunk_mb || chunk_mb > max_chunk_mb) {
            return Err(std::string("upload.chunk_size_mb must lie within [min_chunk_size_mb, max_chunk_size_mb]"));
        }
        if (config.retry.max_retries < 0 || retry_delay_s < 0) {
            return Err(std::string("upload.max_retries and upload.retry_delay_seconds must not be negative"));
        }
        auto policy = upload::backoff_from_string(backoff);
        if (!policy) {
            return Err("upload.backoff must be 'fixed' or 'exponential', got '" + backoff + "'");
        }

        config.chunk_size = static_cast<std::uint64_t>(chunk_mb * kMiB);
        config.min_chunk_size = static_cast<std::uint64_t>(min_chunk_mb * kMiB);
        config.max_chunk_size = static_cast<std::uint64_t>(max_chunk_mb * kMiB);
        config.max_file_size = static_cast<std::uint64_t>(max_file_gb * kGiB);
        config.max_workers = static_cast<std::size_t>(max_workers);
        config.max_concurrent_jobs = static_cast<std::size_t>(max_jobs);
        config.retry.retry_delay = std::chrono::milliseconds(static_cast<std::int64_t>(retry_delay_s * 1000));
        config.retry.backoff = *policy;
        config.retry.chunk_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(chunk_timeout_s * 1000));
        config.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(timeout_min * 60000));
    }

    // jobs
    {
        const json& s = section("jobs");
        double retention_days = config.retention.count() / 86400000.0;
        double watchdog_s = config.watchdog_interval.count() / 1000.0;
        auto read = first_error({read_key(s, "jobs", "retention_days", retention_days),
                                 read_key(s, "jobs", "watchdog_interval_seconds", watchdog_s)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        auto positive = first_error({require_positive(retention_days, "jobs.retention_days"),
                                     require_positive(watchdog_s, "jobs.watchdog_interval_seconds")});
        if (positive.is_error()) {
            return Err(std::move(positive.error()));
        }
        config.retention = std::chrono::milliseconds(static_cast<std::int64_t>(retention_days * 86400000));
        config.watchdog_interval = std::chrono::milliseconds(static_cast<std::int64_t>(watchdog_s * 1000));
    }

    // conversion
    {
        const json& s = section("conversion");
        auto read = read_key(s, "conversion", "command", config.converter_command);
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
    }

    return Ok(std::move(config));
}

Result<void, std::string> apply_env_overrides(ServiceConfig& config) {
    if (const char* dir = std::getenv("SCINGEST_DATA_DIR")) {
        config.data_dir = dir;
    }
    if (const char* dir = std::getenv("SCINGEST_STAGING_DIR")) {
        config.staging_dir = dir;
    }
    if (const char* port = std::getenv("SCINGEST_PORT")) {
        char* end = nullptr;
        const long value = std::strtol(port, &end, 10);
        if (end == port || *end != '\0' || value <= 0 || value > 65535) {
            return Err("SCINGEST_PORT is not a valid port: " + std::string(port));
        }
        config.server.port = static_cast<std::uint16_t>(value);
    }
    return Ok();
}

Result<ServiceConfig, std::string> load_config(const std::filesystem::path& path) {
    json document = json::object();
    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            return Err("cannot open config file " + path.string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        document = json::parse(buffer.str(), nullptr, false);
        if (document.is_discarded()) {
            return Err("config file " + path.string() + " is not valid JSON");
        }
    }

    auto parsed = parse_config(document);
    if (parsed.is_error()) {
        return parsed;
    }
    auto overridden = apply_env_overrides(parsed.value());
    if (overridden.is_error()) {
        return Err(std::move(overridden.error()));
    }
    return parsed;
}

} // namespace scingest
