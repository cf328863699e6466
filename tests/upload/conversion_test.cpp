#include "scingest/upload/conversion.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace scingest::upload;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() /
                   ("scingest_conversion_test_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

ConversionRequest request_for(SensorType sensor) {
    ConversionRequest request;
    request.job_id = "job";
    request.dataset_id = "ds";
    request.input_path = "/tmp/in.tif";
    request.output_dir = "/tmp/out";
    request.sensor = sensor;
    return request;
}

} // namespace

TEST(ConversionTest, UnregisteredSensorFails) {
    ConverterRegistry registry;
    EXPECT_FALSE(registry.supports(SensorType::HDF5));

    auto outcome = registry.dispatch(request_for(SensorType::HDF5));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "no converter registered for sensor HDF5");
}

TEST(ConversionTest, DispatchesBySensor) {
    ConverterRegistry registry;
    std::string seen;
    registry.register_converter(SensorType::TIFF, [&seen](const ConversionRequest& r) {
        seen = r.job_id;
        return ConversionOutcome{true, "tiff ok"};
    });
    registry.register_converter(SensorType::IDX, [](const ConversionRequest&) {
        return ConversionOutcome{false, "idx broken"};
    });

    EXPECT_TRUE(registry.supports(SensorType::TIFF));
    auto tiff = registry.dispatch(request_for(SensorType::TIFF));
    EXPECT_TRUE(tiff.success);
    EXPECT_EQ(tiff.message, "tiff ok");
    EXPECT_EQ(seen, "job");

    auto idx = registry.dispatch(request_for(SensorType::IDX));
    EXPECT_FALSE(idx.success);
    EXPECT_EQ(idx.message, "idx broken");
}

TEST(ConversionTest, ThrowingConverterIsAFailure) {
    ConverterRegistry registry;
    registry.register_converter(SensorType::OTHER, [](const ConversionRequest&) -> ConversionOutcome {
        throw std::runtime_error("segfault in disguise");
    });

    auto outcome = registry.dispatch(request_for(SensorType::OTHER));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "converter threw: segfault in disguise");
}

TEST(ConversionTest, CommandConverterSuccess) {
    auto converter = make_command_converter("true");
    auto outcome = converter(request_for(SensorType::TIFF_RGB));
    EXPECT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(outcome.message, "converted by true");
}

TEST(ConversionTest, CommandConverterNonZeroExit) {
    auto converter = make_command_converter("false");
    auto outcome = converter(request_for(SensorType::TIFF));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "converter exited with status 1");
}

TEST(ConversionTest, CommandConverterReceivesQuotedArguments) {
    auto dir = create_temp_dir();
    const auto script = dir / "convert.sh";
    const auto record = dir / "args.txt";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\nprintf '%s|%s|%s' \"$1\" \"$2\" \"$3\" > '" << record.string() << "'\n";
    }
    fs::permissions(script, fs::perms::owner_all);

    ConversionRequest request = request_for(SensorType::TIFF_RGB);
    request.input_path = dir / "my scan.tif";
    request.output_dir = dir / "out";

    auto outcome = make_command_converter(script.string())(request);
    ASSERT_TRUE(outcome.success) << outcome.message;

    std::ifstream in(record);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, request.input_path.string() + "|" + request.output_dir.string() + "|TIFF RGB");

    fs::remove_all(dir);
}
