#pragma once

#include "scingest/core/error.hpp"
#include "scingest/network/http_client.hpp"
#include "scingest/upload/chunk_transport.hpp"
#include "scingest/upload/types.hpp"
#include "scingest/upload/upload_service.hpp"

#include <chrono>
#include <string>

namespace scingest::api {

/**
 * @brief Typed wrapper over the ingest HTTP API
 *
 * Non-2xx answers come back as the UploadError the server reported.
 */
class UploadClient {
public:
    explicit UploadClient(network::HttpClient http,
                          std::chrono::milliseconds timeout = std::chrono::seconds(30));

    UploadResult<upload::InitiateResponse> initiate(const upload::UploadJobConfig& config) const;
    UploadResult<upload::ChunkReceipt> put_chunk(const std::string& job_id,
                                                 std::size_t index,
                                                 const std::vector<std::uint8_t>& data,
                                                 const std::string& checksum,
                                                 std::chrono::milliseconds timeout) const;
    UploadResult<upload::ResumeInfo> resume_info(const std::string& job_id) const;
    UploadResult<upload::UploadProgress> status(const std::string& job_id) const;
    UploadResult<upload::JobStatus> cancel(const std::string& job_id) const;
    UploadResult<upload::JobStatus> pause(const std::string& job_id) const;
    UploadResult<upload::JobStatus> resume(const std::string& job_id) const;

    const network::HttpClient& http() const { return http_; }

private:
    UploadResult<network::HttpResponse> call(network::HttpRequest request,
                                             std::chrono::milliseconds timeout) const;
    UploadResult<upload::JobStatus> control(const std::string& action, const std::string& job_id) const;

    network::HttpClient http_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief ChunkTransport that PUTs chunks to an ingest server
 */
class HttpChunkTransport : public upload::ChunkTransport {
public:
    explicit HttpChunkTransport(const UploadClient& client) : client_(client) {}

    UploadResult<upload::ChunkAck> transmit(const std::string& job_id,
                                            const upload::ChunkDescriptor& chunk,
                                            const std::vector<std::uint8_t>& payload,
                                            const std::string& checksum,
                                            std::chrono::milliseconds timeout) override;

private:
    const UploadClient& client_;
};

/**
 * @brief ChunkReader for "url" sources: one ranged GET per chunk
 *
 * Accepts 206 with exactly the chunk, or 200 with the whole object (sliced
 * locally, for servers without range support).
 */
class HttpRangeReader : public upload::ChunkReader {
public:
    HttpRangeReader(network::HttpUrl url, std::chrono::milliseconds timeout);

    UploadResult<std::vector<std::uint8_t>> read(const upload::ChunkDescriptor& chunk) override;

private:
    network::HttpUrl url_;
    network::HttpClient http_;
    std::chrono::milliseconds timeout_;
};

} // namespace scingest::api
