#pragma once

#include "scingest/core/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scingest {

enum class ErrorCode {
    InvalidConfig,
    NotFound,
    ChunkRejected,      ///< Payload did not match its declared checksum or length
    ChunkUploadFailed,  ///< Retries exhausted for one chunk
    IntegrityError,     ///< Same chunk committed twice with different content
    InvalidTransition,
    TimeoutExceeded,
    CancelledByUser,
    PayloadTooLarge,
    IoError,
    ConversionFailed
};

struct UploadError {
    ErrorCode code = ErrorCode::IoError;
    std::string message;
    std::optional<std::size_t> chunk_index;

    std::string describe() const;
};

template<typename T>
using UploadResult = Result<T, UploadError>;

const char* to_string(ErrorCode code) noexcept;
std::optional<ErrorCode> error_code_from_string(std::string_view text);

// Failures after which the same upload may be picked up again.
bool is_transient(ErrorCode code) noexcept;

inline UploadError make_error(ErrorCode code, std::string message,
                              std::optional<std::size_t> chunk_index = std::nullopt) {
    return UploadError{code, std::move(message), chunk_index};
}

} // namespace scingest
