#include "scingest/api/upload_routes.hpp"

#include "scingest/api/json_codec.hpp"
#include "scingest/upload/upload_service.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

namespace scingest::api {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using network::make_json_response;

namespace {

constexpr const char* kChecksumHeader = "X-Chunk-Checksum";

std::optional<std::size_t> parse_index(const std::string& text) {
    if (text.empty() || text.size() > 18 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::strtoull(text.c_str(), nullptr, 10));
}

template<typename T>
HttpResponse respond(const UploadResult<T>& result) {
    if (result.is_error()) {
        return error_response(result.error());
    }
    return make_json_response(HttpStatus::OK, to_json(result.value()));
}

HttpResponse respond_status(const std::string& job_id, const UploadResult<upload::JobStatus>& result) {
    if (result.is_error()) {
        return error_response(result.error());
    }
    return make_json_response(HttpStatus::OK,
                              json{{"job_id", job_id}, {"status", upload::to_string(result.value())}});
}

} // namespace

void register_upload_routes(network::HttpRouter& router, upload::UploadService& service) {
    router.post("/upload/initiate", [&service](const HttpContext& ctx) {
        const json body = json::parse(ctx.request.body_as_string(), nullptr, false);
        if (body.is_discarded()) {
            return error_response(make_error(ErrorCode::InvalidConfig, "request body is not valid JSON"));
        }
        auto config = parse_initiate_request(body, service.job_defaults());
        if (config.is_error()) {
            return error_response(config.error());
        }
        return respond(service.initiate(std::move(config.value())));
    });

    router.put("/upload/chunk/:job_id/:index", [&service](const HttpContext& ctx) {
        const auto index = parse_index(ctx.get_param("index"));
        if (!index) {
            return error_response(make_error(ErrorCode::InvalidConfig,
                                             "chunk index '" + ctx.get_param("index") + "' is not a number"));
        }
        return respond(service.put_chunk(ctx.get_param("job_id"), *index, ctx.request.body,
                                         ctx.request.get_header(kChecksumHeader)));
    });

    router.get("/upload/resume/:job_id", [&service](const HttpContext& ctx) {
        return respond(service.resume_info(ctx.get_param("job_id")));
    });

    router.get("/upload/status/:job_id", [&service](const HttpContext& ctx) {
        return respond(service.status(ctx.get_param("job_id")));
    });

    router.get("/upload/chunks/:job_id", [&service](const HttpContext& ctx) {
        return respond(service.chunk_status(ctx.get_param("job_id")));
    });

    router.post("/upload/cancel/:job_id", [&service](const HttpContext& ctx) {
        const std::string job_id = ctx.get_param("job_id");
        return respond_status(job_id, service.cancel(job_id));
    });

    router.post("/upload/pause/:job_id", [&service](const HttpContext& ctx) {
        const std::string job_id = ctx.get_param("job_id");
        return respond_status(job_id, service.pause(job_id));
    });

    router.post("/upload/resume/:job_id", [&service](const HttpContext& ctx) {
        const std::string job_id = ctx.get_param("job_id");
        return respond_status(job_id, service.resume(job_id));
    });

    router.get("/upload/limits", [&service](const HttpContext&) {
        return make_json_response(HttpStatus::OK, to_json(service.limits()));
    });

    router.get("/health", [&service](const HttpContext&) {
        return make_json_response(HttpStatus::OK, to_json(service.health()));
    });
}

} // namespace scingest::api
