#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scingest::upload {

enum class SourceKind {
    Local,  ///< Client pushes chunks over PUT /upload/chunk
    Cloud,  ///< google_drive, s3, dropbox, onedrive; server pulls
    Url     ///< Server pulls from a public URL
};

enum class SensorType {
    IDX,
    TIFF,
    TIFF_RGB,
    NETCDF,
    HDF5,
    NEXUS_4D,
    RGB,
    MAPIR,
    OTHER
};

enum class JobStatus {
    Queued,
    Initializing,
    Uploading,
    Processing,
    Verifying,
    Completed,
    Failed,
    Cancelled,
    Paused
};

enum class BackoffPolicy {
    Fixed,
    Exponential
};

enum class DownloadAccess {
    OnlyOwner,
    OnlyTeam,
    Public
};

const char* to_string(SourceKind kind) noexcept;
const char* to_string(SensorType sensor) noexcept;
const char* to_string(JobStatus status) noexcept;
const char* to_string(BackoffPolicy policy) noexcept;
const char* to_string(DownloadAccess access) noexcept;

std::optional<SourceKind> source_kind_from_string(std::string_view text);
std::optional<SensorType> sensor_from_string(std::string_view text);
std::optional<JobStatus> job_status_from_string(std::string_view text);
std::optional<BackoffPolicy> backoff_from_string(std::string_view text);
std::optional<DownloadAccess> download_access_from_string(std::string_view text);

[[nodiscard]] bool is_terminal(JobStatus status) noexcept;

struct SourceDescriptor {
    SourceKind kind = SourceKind::Local;
    std::string location;  ///< Local path, cloud object id or URL
};

/**
 * @brief Per-chunk retry schedule
 *
 * Attempt n (1-based) that fails waits delay_for_attempt(n) before attempt
 * n + 1. At least one attempt is always made even when max_retries is 0.
 */
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{30000};
    BackoffPolicy backoff = BackoffPolicy::Exponential;
    std::chrono::milliseconds max_delay{std::chrono::minutes(5)};
    std::chrono::milliseconds chunk_timeout{std::chrono::minutes(5)};

    [[nodiscard]] int attempts() const noexcept { return max_retries < 1 ? 1 : max_retries; }
    [[nodiscard]] std::chrono::milliseconds delay_for_attempt(int attempt) const noexcept;
};

struct UploadJobConfig {
    std::string job_id;
    SourceDescriptor source;
    std::filesystem::path destination;  ///< Relative to the service destination root
    std::string dataset_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size = 0;
    std::optional<std::string> file_checksum;
    RetryPolicy retry;
    std::chrono::milliseconds timeout{std::chrono::minutes(120)};
    bool auto_convert = true;
    bool verify_checksum = true;
    SensorType sensor = SensorType::OTHER;

    std::string user_email;
    std::string dataset_name;
    bool is_public = false;
    DownloadAccess downloadable = DownloadAccess::OnlyOwner;
    std::optional<std::string> folder;
    std::optional<std::string> team_uuid;
    std::string description;
    std::optional<std::string> resume_from;

    // Mutated under the owning job record's lock only.
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::string error_message;
    int retry_count = 0;
};

struct ChunkDescriptor {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::string checksum;  ///< Empty until the chunk has been read
    bool committed = false;
};

using ChunkManifest = std::vector<ChunkDescriptor>;

struct ResumeInfo {
    std::string job_id;
    std::vector<std::size_t> missing_chunks;  ///< Ascending
    std::size_t total_chunks = 0;
    std::uint64_t chunk_size = 0;
    bool can_resume = false;
};

struct UploadProgress {
    std::string job_id;
    JobStatus status = JobStatus::Queued;
    double progress_percentage = 0.0;
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t bytes_total = 0;
    double speed_mbps = 0.0;
    double eta_seconds = 0.0;
    std::string current_file;
    std::string error_message;
    std::chrono::system_clock::time_point last_updated{};
};

struct ChunkStatus {
    std::string job_id;
    std::vector<std::size_t> committed_chunks;  ///< Ascending
    std::size_t total_chunks = 0;
    bool complete = false;
    double percentage = 0.0;
};

} // namespace scingest::upload
