#pragma once

#include "scingest/network/http_router.hpp"

namespace scingest::upload {
class UploadService;
}

namespace scingest::api {

/**
 * @brief Register the ingest HTTP API on `router`
 *
 * ROUTES:
 *   POST /upload/initiate
 *   PUT  /upload/chunk/:job_id/:index      (raw bytes, X-Chunk-Checksum header)
 *   GET  /upload/resume/:job_id
 *   GET  /upload/status/:job_id
 *   GET  /upload/chunks/:job_id
 *   POST /upload/cancel/:job_id
 *   POST /upload/pause/:job_id
 *   POST /upload/resume/:job_id
 *   GET  /upload/limits
 *   GET  /health
 *
 * Errors come back as {"error": code, "message": text} with the status
 * from http_status_for(). `service` must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router, upload::UploadService& service);

} // namespace scingest::api
