#include "scingest/config/service_config.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace scingest;
using json = nlohmann::json;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() /
                   ("scingest_config_test_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_); }

private:
    const char* name_;
};

constexpr std::uint64_t kMiB = 1024ULL * 1024;

} // namespace

TEST(ServiceConfigTest, DefaultsMatchDeployment) {
    auto parsed = parse_config(json::object());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const ServiceConfig& config = parsed.value();

    EXPECT_EQ(config.server.port, 5001);
    EXPECT_EQ(config.chunk_size, 64 * kMiB);
    EXPECT_EQ(config.max_file_size, 10ULL * 1024 * 1024 * kMiB);
    EXPECT_EQ(config.retry.max_retries, 3);
    EXPECT_EQ(config.retry.retry_delay, std::chrono::seconds(30));
    EXPECT_EQ(config.timeout, std::chrono::minutes(120));
    EXPECT_EQ(config.retention, std::chrono::hours(24 * 7));
    EXPECT_EQ(config.effective_ledger_dir().string(), (config.staging_dir / "ledger").string());
    EXPECT_TRUE(config.converter_command.empty());
}

TEST(ServiceConfigTest, FileValuesApplied) {
    const json document = {
        {"server", {{"host", "127.0.0.1"}, {"port", 8088}}},
        {"logging", {{"level", "debug"}}},
        {"storage", {{"data_dir", "/srv/datasets"}, {"staging_dir", "/srv/staging"}, {"ledger_dir", "/srv/ledger"}}},
        {"upload", {{"chunk_size_mb", 16}, {"max_workers", 8}, {"max_retries", 5},
                    {"retry_delay_seconds", 1.5}, {"backoff", "fixed"}, {"timeout_minutes", 10}}},
        {"jobs", {{"retention_days", 1}, {"watchdog_interval_seconds", 5}}},
        {"conversion", {{"command", "/opt/scingest/bin/convert"}}},
    };

    auto parsed = parse_config(document);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const ServiceConfig& config = parsed.value();

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8088);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.data_dir.string(), "/srv/datasets");
    EXPECT_EQ(config.effective_ledger_dir().string(), "/srv/ledger");
    EXPECT_EQ(config.chunk_size, 16 * kMiB);
    EXPECT_EQ(config.max_workers, 8u);
    EXPECT_EQ(config.retry.max_retries, 5);
    EXPECT_EQ(config.retry.retry_delay, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.retry.backoff, upload::BackoffPolicy::Fixed);
    EXPECT_EQ(config.timeout, std::chrono::minutes(10));
    EXPECT_EQ(config.retention, std::chrono::hours(24));
    EXPECT_EQ(config.watchdog_interval, std::chrono::seconds(5));
    EXPECT_EQ(config.converter_command, "/opt/scingest/bin/convert");

    const auto options = config.service_options();
    EXPECT_EQ(options.destination_root.string(), "/srv/datasets");
    EXPECT_EQ(options.default_chunk_size, 16 * kMiB);
    EXPECT_EQ(options.max_workers, 8u);
}

TEST(ServiceConfigTest, WrongTypeIsRejected) {
    auto parsed = parse_config(json{{"server", {{"port", "eighty"}}}});
    ASSERT_TRUE(parsed.is_error());
    EXPECT_NE(parsed.error().find("server.port"), std::string::npos);
}

TEST(ServiceConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_TRUE(parse_config(json{{"server", {{"port", 70000}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"upload", {{"chunk_size_mb", 0}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"upload", {{"chunk_size_mb", 4096}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"upload", {{"max_retries", -1}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"upload", {{"backoff", "random"}}}}).is_error());
    EXPECT_TRUE(parse_config(json::array()).is_error());
}

TEST(ServiceConfigTest, LoadReadsFileAndEnvironmentWins) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "scingest.json";
    {
        std::ofstream out(file);
        out << R"({"server": {"port": 7000}, "storage": {"data_dir": "/from/file"}})";
    }

    {
        auto loaded = load_config(file);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error();
        EXPECT_EQ(loaded.value().server.port, 7000);
        EXPECT_EQ(loaded.value().data_dir.string(), "/from/file");
    }

    {
        EnvGuard port("SCINGEST_PORT", "7100");
        EnvGuard data("SCINGEST_DATA_DIR", "/from/env");
        auto loaded = load_config(file);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error();
        EXPECT_EQ(loaded.value().server.port, 7100);
        EXPECT_EQ(loaded.value().data_dir.string(), "/from/env");
    }

    fs::remove_all(dir);
}

TEST(ServiceConfigTest, InvalidEnvironmentPortIsRejected) {
    EnvGuard port("SCINGEST_PORT", "not-a-port");
    auto loaded = load_config({});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("SCINGEST_PORT"), std::string::npos);
}

TEST(ServiceConfigTest, MissingOrBrokenFileIsReported) {
    EXPECT_TRUE(load_config(fs::temp_directory_path() / "scingest_missing_config.json").is_error());

    const auto dir = create_temp_dir();
    const fs::path file = dir / "broken.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    auto loaded = load_config(file);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("not valid JSON"), std::string::npos);
    fs::remove_all(dir);
}
