#include "scingest/upload/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace scingest::upload {
namespace {

template<typename Enum, std::size_t N>
const char* name_of(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) {
    for (const auto& [entry, name] : table) {
        if (entry == value) {
            return name;
        }
    }
    return "UNKNOWN";
}

template<typename Enum, std::size_t N>
std::optional<Enum> value_of(const std::array<std::pair<Enum, const char*>, N>& table,
                             std::string_view text) {
    for (const auto& [entry, name] : table) {
        if (text == name) {
            return entry;
        }
    }
    return std::nullopt;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::pair<SensorType, const char*>, 9> kSensors{{
    {SensorType::IDX, "IDX"},
    {SensorType::TIFF, "TIFF"},
    {SensorType::TIFF_RGB, "TIFF RGB"},
    {SensorType::NETCDF, "NETCDF"},
    {SensorType::HDF5, "HDF5"},
    {SensorType::NEXUS_4D, "4D_NEXUS"},
    {SensorType::RGB, "RGB"},
    {SensorType::MAPIR, "MAPIR"},
    {SensorType::OTHER, "OTHER"},
}};

constexpr std::array<std::pair<JobStatus, const char*>, 9> kStatuses{{
    {JobStatus::Queued, "QUEUED"},
    {JobStatus::Initializing, "INITIALIZING"},
    {JobStatus::Uploading, "UPLOADING"},
    {JobStatus::Processing, "PROCESSING"},
    {JobStatus::Verifying, "VERIFYING"},
    {JobStatus::Completed, "COMPLETED"},
    {JobStatus::Failed, "FAILED"},
    {JobStatus::Cancelled, "CANCELLED"},
    {JobStatus::Paused, "PAUSED"},
}};

constexpr std::array<std::pair<DownloadAccess, const char*>, 3> kAccess{{
    {DownloadAccess::OnlyOwner, "only owner"},
    {DownloadAccess::OnlyTeam, "only team"},
    {DownloadAccess::Public, "public"},
}};

} // namespace

const char* to_string(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::Local: return "local";
        case SourceKind::Cloud: return "cloud";
        case SourceKind::Url: return "url";
    }
    return "local";
}

const char* to_string(SensorType sensor) noexcept {
    return name_of(kSensors, sensor);
}

const char* to_string(JobStatus status) noexcept {
    return name_of(kStatuses, status);
}

const char* to_string(BackoffPolicy policy) noexcept {
    return policy == BackoffPolicy::Fixed ? "fixed" : "exponential";
}

const char* to_string(DownloadAccess access) noexcept {
    return name_of(kAccess, access);
}

std::optional<SourceKind> source_kind_from_string(std::string_view text) {
    const auto key = lowercase(text);
    if (key == "local") {
        return SourceKind::Local;
    }
    if (key == "cloud" || key == "google_drive" || key == "s3" ||
        key == "dropbox" || key == "onedrive") {
        return SourceKind::Cloud;
    }
    if (key == "url") {
        return SourceKind::Url;
    }
    return std::nullopt;
}

std::optional<SensorType> sensor_from_string(std::string_view text) {
    if (text == "TIFF_RGB") {
        return SensorType::TIFF_RGB;
    }
    return value_of(kSensors, text);
}

std::optional<JobStatus> job_status_from_string(std::string_view text) {
    return value_of(kStatuses, text);
}

std::optional<BackoffPolicy> backoff_from_string(std::string_view text) {
    const auto key = lowercase(text);
    if (key == "fixed") {
        return BackoffPolicy::Fixed;
    }
    if (key == "exponential") {
        return BackoffPolicy::Exponential;
    }
    return std::nullopt;
}

std::optional<DownloadAccess> download_access_from_string(std::string_view text) {
    return value_of(kAccess, lowercase(text));
}

bool is_terminal(JobStatus status) noexcept {
    return status == JobStatus::Completed ||
           status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

std::chrono::milliseconds RetryPolicy::delay_for_attempt(int attempt) const noexcept {
    if (backoff == BackoffPolicy::Fixed || attempt <= 1) {
        return std::min(retry_delay, max_delay);
    }
    auto delay = retry_delay;
    for (int i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

} // namespace scingest::upload
