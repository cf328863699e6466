#pragma once

#include "scingest/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scingest {

/**
 * @brief Streaming 64-bit FNV-1a content hash
 *
 * Chunk and whole-file checksums are both rendered as 16 lowercase hex digits,
 * so a file hashed in one pass equals the same bytes hashed chunk by chunk
 * through a single Fnv1a64 instance.
 */
class Fnv1a64 {
public:
    static constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

    void update(const void* data, std::size_t length) noexcept;
    void update(const std::vector<std::uint8_t>& data) noexcept {
        update(data.data(), data.size());
    }

    [[nodiscard]] std::uint64_t digest() const noexcept { return state_; }
    [[nodiscard]] std::string hex() const;

private:
    std::uint64_t state_ = kOffsetBasis;
};

std::string to_hex(std::uint64_t value);

std::string checksum_hex(const std::vector<std::uint8_t>& data);
std::string checksum_hex(const std::string& text);

UploadResult<std::string> checksum_file(const std::filesystem::path& path);

} // namespace scingest
