#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scingest::upload {

/**
 * @brief Source of chunk bytes for the transfer workers
 *
 * Implementations must tolerate concurrent read() calls for different chunks.
 */
class ChunkReader {
public:
    virtual ~ChunkReader() = default;

    virtual UploadResult<std::vector<std::uint8_t>> read(const ChunkDescriptor& chunk) = 0;
};

/**
 * @brief Reads chunks straight from a file on local disk
 *
 * Opens its own stream per call so concurrent workers never share a file
 * position.
 */
class FileChunkReader : public ChunkReader {
public:
    explicit FileChunkReader(std::filesystem::path path);

    UploadResult<std::vector<std::uint8_t>> read(const ChunkDescriptor& chunk) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

struct ChunkAck {
    bool committed = false;
    std::string checksum;             ///< Checksum as computed by the receiver
    std::uint64_t bytes_uploaded = 0; ///< Receiver's running total for the job
};

/**
 * @brief Destination of chunk bytes
 *
 * transmit() must give up after `timeout`; the pool treats that like any
 * other failed attempt.
 */
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;

    virtual UploadResult<ChunkAck> transmit(const std::string& job_id,
                                            const ChunkDescriptor& chunk,
                                            const std::vector<std::uint8_t>& payload,
                                            const std::string& checksum,
                                            std::chrono::milliseconds timeout) = 0;
};

} // namespace scingest::upload
