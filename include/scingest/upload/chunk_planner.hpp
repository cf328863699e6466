#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/types.hpp"

#include <cstddef>
#include <cstdint>

namespace scingest::upload {

/**
 * @brief Splits a file into fixed-size, gap-free chunks
 *
 * Chunk i covers [i * chunk_size, min((i + 1) * chunk_size, file_size)).
 * A zero-byte file still gets one zero-length chunk so that every upload
 * has at least one commit to observe.
 */
class ChunkPlanner {
public:
    static UploadResult<ChunkManifest> plan(std::int64_t file_size, std::int64_t chunk_size);

    // Both helpers expect chunk_size > 0.
    [[nodiscard]] static std::size_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size) noexcept;
    [[nodiscard]] static std::uint64_t expected_length(std::uint64_t file_size,
                                                       std::uint64_t chunk_size,
                                                       std::size_t index) noexcept;
};

} // namespace scingest::upload
