#include "scingest/upload/chunk_transport.hpp"

#include <fstream>

namespace scingest::upload {

FileChunkReader::FileChunkReader(std::filesystem::path path)
    : path_(std::move(path)) {
}

UploadResult<std::vector<std::uint8_t>> FileChunkReader::read(const ChunkDescriptor& chunk) {
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err(make_error(ErrorCode::IoError, "failed to open source file " + path_.string(), chunk.index));
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(chunk.length));
    if (chunk.length == 0) {
        return Ok(std::move(buffer));
    }

    input.seekg(static_cast<std::streamoff>(chunk.offset));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk.length));
    if (static_cast<std::uint64_t>(input.gcount()) != chunk.length) {
        return Err(make_error(ErrorCode::IoError,
                              "short read from " + path_.string() + ": wanted " +
                              std::to_string(chunk.length) + " bytes, got " +
                              std::to_string(input.gcount()),
                              chunk.index));
    }
    return Ok(std::move(buffer));
}

} // namespace scingest::upload
