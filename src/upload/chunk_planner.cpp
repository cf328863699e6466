#include "scingest/upload/chunk_planner.hpp"

#include <algorithm>

namespace scingest::upload {

UploadResult<ChunkManifest> ChunkPlanner::plan(std::int64_t file_size, std::int64_t chunk_size) {
    if (chunk_size <= 0) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "chunk size must be positive, got " + std::to_string(chunk_size)));
    }
    if (file_size < 0) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "file size must not be negative, got " + std::to_string(file_size)));
    }

    const auto size = static_cast<std::uint64_t>(file_size);
    const auto step = static_cast<std::uint64_t>(chunk_size);
    const std::size_t count = chunk_count(size, step);

    ChunkManifest manifest;
    manifest.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        ChunkDescriptor chunk;
        chunk.index = i;
        chunk.offset = static_cast<std::uint64_t>(i) * step;
        chunk.length = expected_length(size, step, i);
        manifest.push_back(std::move(chunk));
    }
    return Ok(std::move(manifest));
}

std::size_t ChunkPlanner::chunk_count(std::uint64_t file_size, std::uint64_t chunk_size) noexcept {
    if (file_size == 0) {
        return 1;
    }
    return static_cast<std::size_t>(file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0));
}

std::uint64_t ChunkPlanner::expected_length(std::uint64_t file_size,
                                            std::uint64_t chunk_size,
                                            std::size_t index) noexcept {
    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size;
    if (offset >= file_size) {
        return 0;
    }
    return std::min(chunk_size, file_size - offset);
}

} // namespace scingest::upload
