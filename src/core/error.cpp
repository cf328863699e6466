#include "scingest/core/error.hpp"

#include <array>
#include <utility>

namespace scingest {
namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 11> kNames{{
    {ErrorCode::InvalidConfig, "InvalidConfig"},
    {ErrorCode::NotFound, "NotFound"},
    {ErrorCode::ChunkRejected, "ChunkRejected"},
    {ErrorCode::ChunkUploadFailed, "ChunkUploadFailed"},
    {ErrorCode::IntegrityError, "IntegrityError"},
    {ErrorCode::InvalidTransition, "InvalidTransition"},
    {ErrorCode::TimeoutExceeded, "TimeoutExceeded"},
    {ErrorCode::CancelledByUser, "CancelledByUser"},
    {ErrorCode::PayloadTooLarge, "PayloadTooLarge"},
    {ErrorCode::IoError, "IoError"},
    {ErrorCode::ConversionFailed, "ConversionFailed"},
}};

} // namespace

const char* to_string(ErrorCode code) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == code) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ErrorCode> error_code_from_string(std::string_view text) {
    for (const auto& [value, name] : kNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_transient(ErrorCode code) noexcept {
    return code == ErrorCode::ChunkUploadFailed || code == ErrorCode::TimeoutExceeded;
}

std::string UploadError::describe() const {
    std::string text = to_string(code);
    if (chunk_index) {
        text += " (chunk " + std::to_string(*chunk_index) + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

} // namespace scingest
