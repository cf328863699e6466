#pragma once

#include "scingest/core/error.hpp"
#include "scingest/network/http_types.hpp"
#include "scingest/upload/types.hpp"
#include "scingest/upload/upload_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace scingest::api {

using json = nlohmann::json;

// ════════════════════════════════════════════════════════
// Requests
// ════════════════════════════════════════════════════════

/**
 * @brief Build a job config from a POST /upload/initiate body
 *
 * Starts from `defaults` (the service defaults) and overrides whatever the
 * body sets. Sizes arrive as chunk_size_mb, or chunk_size in bytes which
 * wins when both are present. Missing required fields and wrongly typed
 * values are InvalidConfig; range checks are left to the service.
 */
UploadResult<upload::UploadJobConfig> parse_initiate_request(const json& body,
                                                             upload::UploadJobConfig defaults);

/**
 * @brief Inverse of parse_initiate_request for the fields a client sends
 */
json initiate_request_to_json(const upload::UploadJobConfig& config);

// ════════════════════════════════════════════════════════
// Responses
// ════════════════════════════════════════════════════════

json to_json(const upload::InitiateResponse& response);
json to_json(const upload::ChunkReceipt& receipt);
json to_json(const upload::ResumeInfo& info);
json to_json(const upload::UploadProgress& progress);
json to_json(const upload::ChunkStatus& status);
json to_json(const upload::ServiceLimits& limits);
json to_json(const upload::ServiceHealth& health);

UploadResult<upload::InitiateResponse> initiate_response_from_json(const json& body);
UploadResult<upload::ChunkReceipt> chunk_receipt_from_json(const json& body);
UploadResult<upload::ResumeInfo> resume_info_from_json(const json& body);
UploadResult<upload::UploadProgress> progress_from_json(const json& body);

// ════════════════════════════════════════════════════════
// Errors
// ════════════════════════════════════════════════════════

network::HttpStatus http_status_for(ErrorCode code) noexcept;

// {"error": "<ErrorCode>", "message": "..."} with the mapped status.
network::HttpResponse error_response(const UploadError& error);

/**
 * @brief Recover the UploadError from an error response
 *
 * Unknown codes map by status: 404 NotFound, 409 InvalidTransition,
 * 413 PayloadTooLarge, 400 InvalidConfig, anything else IoError.
 */
UploadError error_from_response(const network::HttpResponse& response);

// ISO 8601, UTC, second precision: "2026-10-17T08:30:00Z"
std::string format_timestamp(std::chrono::system_clock::time_point time);

} // namespace scingest::api
