#include "scingest/core/checksum.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace scingest {

void Fnv1a64::update(const void* data, std::size_t length) noexcept {
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::uint64_t hash = state_;
    for (std::size_t i = 0; i < length; ++i) {
        hash ^= static_cast<std::uint64_t>(bytes[i]);
        hash *= kPrime;
    }
    state_ = hash;
}

std::string Fnv1a64::hex() const {
    return to_hex(state_);
}

std::string to_hex(std::uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

std::string checksum_hex(const std::vector<std::uint8_t>& data) {
    Fnv1a64 hasher;
    hasher.update(data);
    return hasher.hex();
}

std::string checksum_hex(const std::string& text) {
    Fnv1a64 hasher;
    hasher.update(text.data(), text.size());
    return hasher.hex();
}

UploadResult<std::string> checksum_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(make_error(ErrorCode::IoError, "Failed to open " + path.string()));
    }

    Fnv1a64 hasher;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hasher.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err(make_error(ErrorCode::IoError, "Read failed for " + path.string()));
    }
    return Ok(hasher.hex());
}

} // namespace scingest
