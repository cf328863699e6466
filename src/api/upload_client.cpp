#include "scingest/api/upload_client.hpp"

#include "scingest/api/json_codec.hpp"

namespace scingest::api {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

bool is_success(const HttpResponse& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

UploadResult<json> parse_body(const HttpResponse& response) {
    json body = json::parse(response.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err(make_error(ErrorCode::IoError,
                              "server answered " + std::to_string(response.status_code) + " with a non-JSON body"));
    }
    return Ok(std::move(body));
}

} // namespace

UploadClient::UploadClient(network::HttpClient http, std::chrono::milliseconds timeout)
    : http_(std::move(http)), timeout_(timeout) {
}

UploadResult<HttpResponse> UploadClient::call(HttpRequest request, std::chrono::milliseconds timeout) const {
    auto response = http_.send(std::move(request), timeout);
    if (response.is_error()) {
        return Err(make_error(ErrorCode::IoError, response.error()));
    }
    if (!is_success(response.value())) {
        return Err(error_from_response(response.value()));
    }
    return Ok(std::move(response.value()));
}

UploadResult<upload::InitiateResponse> UploadClient::initiate(const upload::UploadJobConfig& config) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/upload/initiate";
    request.headers["Content-Type"] = "application/json";
    const std::string body = initiate_request_to_json(config).dump();
    request.body.assign(body.begin(), body.end());

    auto response = call(std::move(request), timeout_);
    if (response.is_error()) {
        return Err(std::move(response.error()));
    }
    auto parsed = parse_body(response.value());
    if (parsed.is_error()) {
        return Err(std::move(parsed.error()));
    }
    return initiate_response_from_json(parsed.value());
}

UploadResult<upload::ChunkReceipt> UploadClient::put_chunk(const std::string& job_id,
                                                           std::size_t index,
                                                           const std::vector<std::uint8_t>& data,
                                                           const std::string& checksum,
                                                           std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = "/upload/chunk/" + job_id + "/" + std::to_string(index);
    request.headers["Content-Type"] = "application/octet-stream";
    request.headers["X-Chunk-Checksum"] = checksum;
    request.body = data;

    auto response = call(std::move(request), timeout);
    if (response.is_error()) {
        return Err(std::move(response.error()));
    }
    auto parsed = parse_body(response.value());
    if (parsed.is_error()) {
        return Err(std::move(parsed.error()));
    }
    return chunk_receipt_from_json(parsed.value());
}

UploadResult<upload::ResumeInfo> UploadClient::resume_info(const std::string& job_id) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/upload/resume/" + job_id;
    auto response = call(std::move(request), timeout_);
    if (response.is_error()) {
        return Err(std::move(response.error()));
    }
    auto parsed = parse_body(response.value());
    if (parsed.is_error()) {
        return Err(std::move(parsed.error()));
    }
    return resume_info_from_json(parsed.value());
}

UploadResult<upload::UploadProgress> UploadClient::status(const std::string& job_id) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/upload/status/" + job_id;
    auto response = call(std::move(request), timeout_);
    if (response.is_error()) {
        return Err(std::move(response.error()));
    }
    auto parsed = parse_body(response.value());
    if (parsed.is_error()) {
        return Err(std::move(parsed.error()));
    }
    return progress_from_json(parsed.value());
}

UploadResult<upload::JobStatus> UploadClient::control(const std::string& action, const std::string& job_id) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/upload/" + action + "/" + job_id;
    auto response = call(std::move(request), timeout_);
    if (response.is_error()) {
        return Err(std::move(response.error()));
    }
    auto parsed = parse_body(response.value());
    if (parsed.is_error()) {
        return Err(std::move(parsed.error()));
    }
    const json& body = parsed.value();
    if (!body.is_object() || !body.contains("status") || !body.at("status").is_string()) {
        return Err(make_error(ErrorCode::IoError, "malformed " + action + " response"));
    }
    auto status = upload::job_status_from_string(body.at("status").get<std::string>());
    if (!status) {
        return Err(make_error(ErrorCode::IoError, "unknown job status in " + action + " response"));
    }
    return Ok(*status);
}

UploadResult<upload::JobStatus> UploadClient::cancel(const std::string& job_id) const {
    return control("cancel", job_id);
}

UploadResult<upload::JobStatus> UploadClient::pause(const std::string& job_id) const {
    return control("pause", job_id);
}

UploadResult<upload::JobStatus> UploadClient::resume(const std::string& job_id) const {
    return control("resume", job_id);
}

// ════════════════════════════════════════════════════════
// HttpChunkTransport
// ════════════════════════════════════════════════════════

UploadResult<upload::ChunkAck> HttpChunkTransport::transmit(const std::string& job_id,
                                                            const upload::ChunkDescriptor& chunk,
                                                            const std::vector<std::uint8_t>& payload,
                                                            const std::string& checksum,
                                                            std::chrono::milliseconds timeout) {
    auto receipt = client_.put_chunk(job_id, chunk.index, payload, checksum, timeout);
    if (receipt.is_error()) {
        UploadError error = std::move(receipt.error());
        if (!error.chunk_index) {
            error.chunk_index = chunk.index;
        }
        return Err(std::move(error));
    }
    const auto& r = receipt.value();
    return Ok(upload::ChunkAck{r.committed, r.checksum, r.bytes_uploaded});
}

// ════════════════════════════════════════════════════════
// HttpRangeReader
// ════════════════════════════════════════════════════════

HttpRangeReader::HttpRangeReader(network::HttpUrl url, std::chrono::milliseconds timeout)
    : url_(url), http_(url.host, url.port), timeout_(timeout) {
}

UploadResult<std::vector<std::uint8_t>> HttpRangeReader::read(const upload::ChunkDescriptor& chunk) {
    if (chunk.length == 0) {
        return Ok(std::vector<std::uint8_t>{});
    }

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url_.target;
    request.headers["Range"] = "bytes=" + std::to_string(chunk.offset) + "-" +
                               std::to_string(chunk.offset + chunk.length - 1);

    auto response = http_.send(std::move(request), timeout_);
    if (response.is_error()) {
        return Err(make_error(ErrorCode::IoError, response.error(), chunk.index));
    }

    HttpResponse& r = response.value();
    if (r.status_code == 206 && r.body.size() == chunk.length) {
        return Ok(std::move(r.body));
    }
    if (r.status_code == 200 && r.body.size() >= chunk.offset + chunk.length) {
        const auto begin = r.body.begin() + static_cast<std::ptrdiff_t>(chunk.offset);
        return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(chunk.length)));
    }
    return Err(make_error(ErrorCode::IoError,
                          "source answered " + std::to_string(r.status_code) + " with " +
                              std::to_string(r.body.size()) + " bytes for a " +
                              std::to_string(chunk.length) + "-byte range",
                          chunk.index));
}

} // namespace scingest::api
