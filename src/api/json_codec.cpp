#include "scingest/api/json_codec.hpp"

#include "scingest/network/http_router.hpp"

#include <cmath>
#include <ctime>

namespace scingest::api {

using upload::UploadJobConfig;

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

UploadError invalid(const std::string& message) {
    return make_error(ErrorCode::InvalidConfig, message);
}

template<typename T>
UploadResult<void> read_field(const json& body, const char* key, T& out) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        return Err(invalid(std::string("field '") + key + "' has the wrong type"));
    }
    return Ok();
}

template<typename T>
UploadResult<void> read_optional(const json& body, const char* key, std::optional<T>& out) {
    if (body.contains(key) && !body.at(key).is_null()) {
        T value{};
        auto read = read_field(body, key, value);
        if (read.is_error()) {
            return read;
        }
        out = std::move(value);
    }
    return Ok();
}

UploadResult<void> read_byte_count(const json& body, const char* key, std::uint64_t& out) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err(invalid(std::string("field '") + key + "' must be a non-negative integer"));
    }
    out = it->get<std::uint64_t>();
    return Ok();
}

UploadResult<void> read_seconds(const json& body, const char* key, double scale,
                                std::chrono::milliseconds& out) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_number()) {
        return Err(invalid(std::string("field '") + key + "' must be a number"));
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(it->get<double>() * scale)));
    return Ok();
}

template<typename T>
UploadResult<T> bad_response(const std::string& what) {
    return Err(make_error(ErrorCode::IoError, "malformed " + what + " response"));
}

} // namespace

// ════════════════════════════════════════════════════════
// Requests
// ════════════════════════════════════════════════════════

UploadResult<UploadJobConfig> parse_initiate_request(const json& body, UploadJobConfig config) {
    if (!body.is_object()) {
        return Err(invalid("request body must be a JSON object"));
    }

    auto resume_from = read_optional(body, "resume_from", config.resume_from);
    if (resume_from.is_error()) {
        return Err(std::move(resume_from.error()));
    }

    // source
    if (body.contains("source")) {
        const json& source = body.at("source");
        if (!source.is_object()) {
            return Err(invalid("field 'source' must be an object"));
        }
        std::string kind = "local";
        auto read = first_error({read_field(source, "kind", kind),
                                 read_field(source, "location", config.source.location)});
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        auto parsed = upload::source_kind_from_string(kind);
        if (!parsed) {
            return Err(invalid("unknown source kind '" + kind + "'"));
        }
        config.source.kind = *parsed;
    }

    std::string destination;
    auto names = first_error({read_field(body, "destination", destination),
                              read_field(body, "dataset_id", config.dataset_id),
                              read_field(body, "file_name", config.file_name)});
    if (names.is_error()) {
        return Err(std::move(names.error()));
    }
    config.destination = destination;

    if (!body.contains("file_size") && !config.resume_from) {
        return Err(invalid("field 'file_size' is required"));
    }
    auto file_size = read_byte_count(body, "file_size", config.file_size);
    if (file_size.is_error()) {
        return Err(std::move(file_size.error()));
    }

    if (body.contains("chunk_size_mb") && !body.at("chunk_size_mb").is_null()) {
        const json& mb = body.at("chunk_size_mb");
        if (!mb.is_number() || mb.get<double>() <= 0) {
            return Err(invalid("field 'chunk_size_mb' must be a positive number"));
        }
        config.chunk_size = static_cast<std::uint64_t>(std::llround(mb.get<double>() * kBytesPerMiB));
    } else if (config.resume_from) {
        config.chunk_size = 0;  // Inherited from the resumed job
    }
    auto fields = first_error({read_byte_count(body, "chunk_size", config.chunk_size),
                               read_field(body, "user_email", config.user_email),
                               read_field(body, "dataset_name", config.dataset_name),
                               read_field(body, "description", config.description),
                               read_field(body, "convert", config.auto_convert),
                               read_field(body, "is_public", config.is_public),
                               read_field(body, "verify_checksum", config.verify_checksum),
                               read_optional(body, "folder", config.folder),
                               read_optional(body, "team_uuid", config.team_uuid),
                               read_optional(body, "file_checksum", config.file_checksum)});
    if (fields.is_error()) {
        return Err(std::move(fields.error()));
    }

    if (body.contains("sensor") && !body.at("sensor").is_null()) {
        std::string sensor;
        auto read = read_field(body, "sensor", sensor);
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        auto parsed = upload::sensor_from_string(sensor);
        if (!parsed) {
            return Err(invalid("unknown sensor '" + sensor + "'"));
        }
        config.sensor = *parsed;
    }

    if (body.contains("is_downloadable") && !body.at("is_downloadable").is_null()) {
        std::string access;
        auto read = read_field(body, "is_downloadable", access);
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        auto parsed = upload::download_access_from_string(access);
        if (!parsed) {
            return Err(invalid("unknown is_downloadable value '" + access + "'"));
        }
        config.downloadable = *parsed;
    }

    auto retry = first_error({read_field(body, "max_retries", config.retry.max_retries),
                              read_seconds(body, "retry_delay_seconds", 1000.0, config.retry.retry_delay),
                              read_seconds(body, "chunk_timeout_seconds", 1000.0, config.retry.chunk_timeout),
                              read_seconds(body, "timeout_minutes", 60000.0, config.timeout)});
    if (retry.is_error()) {
        return Err(std::move(retry.error()));
    }
    if (body.contains("backoff") && !body.at("backoff").is_null()) {
        std::string backoff;
        auto read = read_field(body, "backoff", backoff);
        if (read.is_error()) {
            return Err(std::move(read.error()));
        }
        auto parsed = upload::backoff_from_string(backoff);
        if (!parsed) {
            return Err(invalid("unknown backoff '" + backoff + "'"));
        }
        config.retry.backoff = *parsed;
    }

    return Ok(std::move(config));
}

json initiate_request_to_json(const UploadJobConfig& config) {
    json body = {
        {"source", {{"kind", upload::to_string(config.source.kind)}, {"location", config.source.location}}},
        {"destination", config.destination.generic_string()},
        {"dataset_id", config.dataset_id},
        {"file_name", config.file_name},
        {"file_size", config.file_size},
        {"chunk_size", config.chunk_size},
        {"user_email", config.user_email},
        {"dataset_name", config.dataset_name},
        {"sensor", upload::to_string(config.sensor)},
        {"convert", config.auto_convert},
        {"is_public", config.is_public},
        {"is_downloadable", upload::to_string(config.downloadable)},
        {"description", config.description},
        {"verify_checksum", config.verify_checksum},
        {"max_retries", config.retry.max_retries},
        {"retry_delay_seconds", config.retry.retry_delay.count() / 1000.0},
        {"backoff", upload::to_string(config.retry.backoff)},
        {"chunk_timeout_seconds", config.retry.chunk_timeout.count() / 1000.0},
        {"timeout_minutes", config.timeout.count() / 60000.0},
    };
    if (config.folder) {
        body["folder"] = *config.folder;
    }
    if (config.team_uuid) {
        body["team_uuid"] = *config.team_uuid;
    }
    if (config.file_checksum) {
        body["file_checksum"] = *config.file_checksum;
    }
    if (config.resume_from) {
        body["resume_from"] = *config.resume_from;
    }
    return body;
}

// ════════════════════════════════════════════════════════
// Responses
// ════════════════════════════════════════════════════════

json to_json(const upload::InitiateResponse& response) {
    return {
        {"job_id", response.job_id},
        {"status", upload::to_string(response.status)},
        {"chunk_size", response.chunk_size},
        {"total_chunks", response.total_chunks},
    };
}

json to_json(const upload::ChunkReceipt& receipt) {
    return {
        {"committed", receipt.committed},
        {"duplicate", receipt.duplicate},
        {"checksum", receipt.checksum},
        {"bytes_uploaded", receipt.bytes_uploaded},
    };
}

json to_json(const upload::ResumeInfo& info) {
    return {
        {"job_id", info.job_id},
        {"missing_chunks", info.missing_chunks},
        {"total_chunks", info.total_chunks},
        {"chunk_size", info.chunk_size},
        {"can_resume", info.can_resume},
    };
}

json to_json(const upload::UploadProgress& progress) {
    return {
        {"job_id", progress.job_id},
        {"status", upload::to_string(progress.status)},
        {"progress_percentage", progress.progress_percentage},
        {"bytes_uploaded", progress.bytes_uploaded},
        {"bytes_total", progress.bytes_total},
        {"speed_mbps", progress.speed_mbps},
        {"eta_seconds", progress.eta_seconds},
        {"current_file", progress.current_file},
        {"error_message", progress.error_message},
        {"last_updated", format_timestamp(progress.last_updated)},
    };
}

json to_json(const upload::ChunkStatus& status) {
    return {
        {"job_id", status.job_id},
        {"committed_chunks", status.committed_chunks},
        {"total_chunks", status.total_chunks},
        {"complete", status.complete},
        {"percentage", status.percentage},
    };
}

json to_json(const upload::ServiceLimits& limits) {
    return {
        {"max_file_size", limits.max_file_size},
        {"default_chunk_size", limits.default_chunk_size},
        {"min_chunk_size", limits.min_chunk_size},
        {"max_chunk_size", limits.max_chunk_size},
        {"default_timeout_minutes", limits.default_timeout.count() / 60000.0},
        {"retention_days", limits.retention.count() / 86400000.0},
        {"max_workers", limits.max_workers},
        {"max_concurrent_jobs", limits.max_concurrent_jobs},
        {"supported_sources", limits.source_types},
        {"supported_sensors", limits.sensors},
    };
}

json to_json(const upload::ServiceHealth& health) {
    return {
        {"status", "healthy"},
        {"active_jobs", health.active_jobs},
        {"total_jobs", health.total_jobs},
        {"timestamp", format_timestamp(std::chrono::system_clock::now())},
    };
}

UploadResult<upload::InitiateResponse> initiate_response_from_json(const json& body) {
    if (!body.is_object() || !body.contains("job_id") || !body.contains("total_chunks")) {
        return bad_response<upload::InitiateResponse>("initiate");
    }
    try {
        upload::InitiateResponse response;
        response.job_id = body.at("job_id").get<std::string>();
        response.chunk_size = body.value("chunk_size", std::uint64_t{0});
        response.total_chunks = body.at("total_chunks").get<std::size_t>();
        response.status = upload::job_status_from_string(body.value("status", std::string("QUEUED")))
                              .value_or(upload::JobStatus::Queued);
        return Ok(std::move(response));
    } catch (const json::exception&) {
        return bad_response<upload::InitiateResponse>("initiate");
    }
}

UploadResult<upload::ChunkReceipt> chunk_receipt_from_json(const json& body) {
    if (!body.is_object()) {
        return bad_response<upload::ChunkReceipt>("chunk");
    }
    try {
        upload::ChunkReceipt receipt;
        receipt.committed = body.value("committed", false);
        receipt.duplicate = body.value("duplicate", false);
        receipt.checksum = body.value("checksum", std::string());
        receipt.bytes_uploaded = body.value("bytes_uploaded", std::uint64_t{0});
        return Ok(std::move(receipt));
    } catch (const json::exception&) {
        return bad_response<upload::ChunkReceipt>("chunk");
    }
}

UploadResult<upload::ResumeInfo> resume_info_from_json(const json& body) {
    if (!body.is_object()) {
        return bad_response<upload::ResumeInfo>("resume");
    }
    try {
        upload::ResumeInfo info;
        info.job_id = body.value("job_id", std::string());
        info.missing_chunks = body.value("missing_chunks", std::vector<std::size_t>{});
        info.total_chunks = body.value("total_chunks", std::size_t{0});
        info.chunk_size = body.value("chunk_size", std::uint64_t{0});
        info.can_resume = body.value("can_resume", false);
        return Ok(std::move(info));
    } catch (const json::exception&) {
        return bad_response<upload::ResumeInfo>("resume");
    }
}

UploadResult<upload::UploadProgress> progress_from_json(const json& body) {
    if (!body.is_object()) {
        return bad_response<upload::UploadProgress>("status");
    }
    try {
        upload::UploadProgress progress;
        progress.job_id = body.value("job_id", std::string());
        progress.status = upload::job_status_from_string(body.value("status", std::string()))
                              .value_or(upload::JobStatus::Queued);
        progress.progress_percentage = body.value("progress_percentage", 0.0);
        progress.bytes_uploaded = body.value("bytes_uploaded", std::uint64_t{0});
        progress.bytes_total = body.value("bytes_total", std::uint64_t{0});
        progress.speed_mbps = body.value("speed_mbps", 0.0);
        progress.eta_seconds = body.value("eta_seconds", 0.0);
        progress.current_file = body.value("current_file", std::string());
        progress.error_message = body.value("error_message", std::string());
        return Ok(std::move(progress));
    } catch (const json::exception&) {
        return bad_response<upload::UploadProgress>("status");
    }
}

// ════════════════════════════════════════════════════════
// Errors
// ════════════════════════════════════════════════════════

network::HttpStatus http_status_for(ErrorCode code) noexcept {
    using network::HttpStatus;
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::ChunkRejected:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorCode::InvalidTransition:
        case ErrorCode::IntegrityError:
            return HttpStatus::CONFLICT;
        case ErrorCode::PayloadTooLarge:
            return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::ChunkUploadFailed:
        case ErrorCode::TimeoutExceeded:
        case ErrorCode::CancelledByUser:
        case ErrorCode::IoError:
        case ErrorCode::ConversionFailed:
            break;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

network::HttpResponse error_response(const UploadError& error) {
    json body = {{"error", to_string(error.code)}, {"message", error.message}};
    if (error.chunk_index) {
        body["chunk_index"] = *error.chunk_index;
    }
    return network::make_json_response(http_status_for(error.code), body);
}

UploadError error_from_response(const network::HttpResponse& response) {
    const json body = json::parse(response.body_as_string(), nullptr, false);
    std::string message = "HTTP " + std::to_string(response.status_code);
    std::optional<ErrorCode> code;
    std::optional<std::size_t> chunk_index;

    if (body.is_object()) {
        if (body.contains("error") && body.at("error").is_string()) {
            code = error_code_from_string(body.at("error").get<std::string>());
        }
        if (body.contains("message") && body.at("message").is_string()) {
            message = body.at("message").get<std::string>();
        }
        if (body.contains("chunk_index") && body.at("chunk_index").is_number_unsigned()) {
            chunk_index = body.at("chunk_index").get<std::size_t>();
        }
    }

    if (!code) {
        switch (response.status_code) {
            case 400: code = ErrorCode::InvalidConfig; break;
            case 404: code = ErrorCode::NotFound; break;
            case 409: code = ErrorCode::InvalidTransition; break;
            case 413: code = ErrorCode::PayloadTooLarge; break;
            default: code = ErrorCode::IoError; break;
        }
    }
    return make_error(*code, message, chunk_index);
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace scingest::api
