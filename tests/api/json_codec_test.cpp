#include "scingest/api/json_codec.hpp"

#include <gtest/gtest.h>

using namespace scingest;
using namespace scingest::api;
using namespace scingest::upload;

namespace {

UploadJobConfig defaults() {
    UploadJobConfig config;
    config.chunk_size = 64 * 1024 * 1024;
    return config;
}

} // namespace

TEST(JsonCodecTest, ParsesFullInitiateRequest) {
    const json body = json::parse(R"({
        "source": {"kind": "google_drive", "location": "drive-file-1"},
        "destination": "projects/run1",
        "dataset_id": "ds-42",
        "file_name": "field.tif",
        "file_size": 26214400,
        "chunk_size_mb": 10,
        "user_email": "someone@example.org",
        "dataset_name": "Field survey",
        "sensor": "TIFF RGB",
        "convert": false,
        "is_public": true,
        "is_downloadable": "only team",
        "folder": "surveys",
        "team_uuid": "t-1",
        "description": "drone pass",
        "file_checksum": "cbf29ce484222325",
        "max_retries": 5,
        "retry_delay_seconds": 1.5,
        "backoff": "fixed",
        "chunk_timeout_seconds": 60,
        "timeout_minutes": 30
    })");

    auto parsed = parse_initiate_request(body, defaults());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().describe();
    const auto& config = parsed.value();
    EXPECT_EQ(config.source.kind, SourceKind::Cloud);
    EXPECT_EQ(config.source.location, "drive-file-1");
    EXPECT_EQ(config.destination.generic_string(), "projects/run1");
    EXPECT_EQ(config.dataset_id, "ds-42");
    EXPECT_EQ(config.file_size, 26214400u);
    EXPECT_EQ(config.chunk_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.sensor, SensorType::TIFF_RGB);
    EXPECT_FALSE(config.auto_convert);
    EXPECT_TRUE(config.is_public);
    EXPECT_EQ(config.downloadable, DownloadAccess::OnlyTeam);
    EXPECT_EQ(config.folder, std::optional<std::string>("surveys"));
    EXPECT_EQ(config.file_checksum, std::optional<std::string>("cbf29ce484222325"));
    EXPECT_EQ(config.retry.max_retries, 5);
    EXPECT_EQ(config.retry.retry_delay, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.retry.backoff, BackoffPolicy::Fixed);
    EXPECT_EQ(config.retry.chunk_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.timeout, std::chrono::minutes(30));
}

TEST(JsonCodecTest, DefaultsFillOmittedFields) {
    auto parsed = parse_initiate_request(json{{"dataset_id", "ds"}, {"file_name", "a.bin"}, {"file_size", 5}},
                                         defaults());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().source.kind, SourceKind::Local);
    EXPECT_EQ(parsed.value().chunk_size, 64u * 1024 * 1024);
    EXPECT_TRUE(parsed.value().auto_convert);
    EXPECT_EQ(parsed.value().sensor, SensorType::OTHER);
    EXPECT_FALSE(parsed.value().file_checksum.has_value());
}

TEST(JsonCodecTest, ChunkSizeInBytesIsAccepted) {
    auto parsed = parse_initiate_request(
        json{{"dataset_id", "ds"}, {"file_name", "a.bin"}, {"file_size", 5}, {"chunk_size", 4096}}, defaults());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().chunk_size, 4096u);
}

TEST(JsonCodecTest, ResumeRequestMayOmitLayout) {
    auto parsed = parse_initiate_request(json{{"file_name", "a.bin"}, {"resume_from", "upload_1"}}, defaults());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().resume_from, std::optional<std::string>("upload_1"));
    EXPECT_EQ(parsed.value().chunk_size, 0u);
    EXPECT_EQ(parsed.value().file_size, 0u);
}

TEST(JsonCodecTest, RejectsBadInitiateRequests) {
    const auto code_of = [](const json& body) {
        auto parsed = parse_initiate_request(body, defaults());
        return parsed.is_error() ? parsed.error().code : ErrorCode::IoError;
    };

    EXPECT_EQ(code_of(json::array()), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"dataset_id", "ds"}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", -1}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", "big"}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"chunk_size_mb", 0}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"sensor", "XRAY"}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"source", {{"kind", "ftp"}}}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"backoff", "random"}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"convert", "yes"}}), ErrorCode::InvalidConfig);
    EXPECT_EQ(code_of(json{{"file_size", 1}, {"is_downloadable", "everyone"}}), ErrorCode::InvalidConfig);
}

TEST(JsonCodecTest, ClientRequestParsesOnServer) {
    UploadJobConfig config;
    config.dataset_id = "ds";
    config.file_name = "scan.nc";
    config.file_size = 1000;
    config.chunk_size = 300;
    config.sensor = SensorType::NETCDF;
    config.retry.retry_delay = std::chrono::seconds(2);
    config.file_checksum = std::string("0123456789abcdef");

    auto parsed = parse_initiate_request(initiate_request_to_json(config), defaults());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().describe();
    EXPECT_EQ(parsed.value().chunk_size, 300u);
    EXPECT_EQ(parsed.value().sensor, SensorType::NETCDF);
    EXPECT_EQ(parsed.value().retry.retry_delay, std::chrono::seconds(2));
    EXPECT_EQ(parsed.value().file_checksum, config.file_checksum);
}

TEST(JsonCodecTest, ProgressDocument) {
    UploadProgress progress;
    progress.job_id = "upload_1";
    progress.status = JobStatus::Uploading;
    progress.bytes_uploaded = 10;
    progress.bytes_total = 40;
    progress.progress_percentage = 25.0;
    progress.last_updated = std::chrono::system_clock::from_time_t(0);

    const json body = to_json(progress);
    EXPECT_EQ(body["status"], "UPLOADING");
    EXPECT_EQ(body["last_updated"], "1970-01-01T00:00:00Z");

    auto back = progress_from_json(body);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().status, JobStatus::Uploading);
    EXPECT_EQ(back.value().bytes_total, 40u);
}

TEST(JsonCodecTest, ResumeInfoCarriesChunkSize) {
    ResumeInfo info{"upload_1", {1, 4}, 6, 1024, true};
    auto back = resume_info_from_json(to_json(info));
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().missing_chunks, (std::vector<std::size_t>{1, 4}));
    EXPECT_EQ(back.value().chunk_size, 1024u);
    EXPECT_TRUE(back.value().can_resume);

    EXPECT_TRUE(resume_info_from_json(json::array()).is_error());
    EXPECT_TRUE(resume_info_from_json(json{{"missing_chunks", "none"}}).is_error());
}

TEST(JsonCodecTest, InitiateResponseRequiresJobId) {
    EXPECT_TRUE(initiate_response_from_json(json{{"total_chunks", 1}}).is_error());
    auto ok = initiate_response_from_json(json{{"job_id", "upload_9"}, {"total_chunks", 3}, {"status", "QUEUED"}});
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().total_chunks, 3u);
}

TEST(JsonCodecTest, ErrorStatusMapping) {
    EXPECT_EQ(http_status_for(ErrorCode::InvalidConfig), network::HttpStatus::BAD_REQUEST);
    EXPECT_EQ(http_status_for(ErrorCode::ChunkRejected), network::HttpStatus::BAD_REQUEST);
    EXPECT_EQ(http_status_for(ErrorCode::NotFound), network::HttpStatus::NOT_FOUND);
    EXPECT_EQ(http_status_for(ErrorCode::InvalidTransition), network::HttpStatus::CONFLICT);
    EXPECT_EQ(http_status_for(ErrorCode::IntegrityError), network::HttpStatus::CONFLICT);
    EXPECT_EQ(http_status_for(ErrorCode::PayloadTooLarge), network::HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(http_status_for(ErrorCode::IoError), network::HttpStatus::INTERNAL_SERVER_ERROR);
}

TEST(JsonCodecTest, ErrorSurvivesTheWire) {
    const auto response = error_response(make_error(ErrorCode::IntegrityError, "checksum clash", 7));
    EXPECT_EQ(response.status_code, 409);

    const UploadError error = error_from_response(response);
    EXPECT_EQ(error.code, ErrorCode::IntegrityError);
    EXPECT_EQ(error.message, "checksum clash");
    ASSERT_TRUE(error.chunk_index.has_value());
    EXPECT_EQ(*error.chunk_index, 7u);
}

TEST(JsonCodecTest, ErrorFromNonJsonResponseUsesStatus) {
    network::HttpResponse response(network::HttpStatus::NOT_FOUND);
    response.set_body(std::string("<html>gone</html>"));
    const UploadError error = error_from_response(response);
    EXPECT_EQ(error.code, ErrorCode::NotFound);
    EXPECT_EQ(error.message, "HTTP 404");
}
