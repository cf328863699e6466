#pragma once

#include "scingest/upload/types.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace scingest::upload {

struct ConversionRequest {
    std::string job_id;
    std::string dataset_id;
    std::filesystem::path input_path;  ///< Fully assembled upload
    std::filesystem::path output_dir;
    SensorType sensor = SensorType::OTHER;
};

struct ConversionOutcome {
    bool success = false;
    std::string message;
};

/**
 * @brief Boundary to the format converters
 *
 * Called once per job, only after every chunk is committed and the file has
 * been assembled.
 */
class ConversionDispatcher {
public:
    virtual ~ConversionDispatcher() = default;

    virtual ConversionOutcome dispatch(const ConversionRequest& request) = 0;
};

/**
 * @brief Dispatcher that maps each sensor type to a registered converter
 *
 * A converter that throws std::exception is reported as a failed conversion.
 */
class ConverterRegistry : public ConversionDispatcher {
public:
    using Converter = std::function<ConversionOutcome(const ConversionRequest&)>;

    void register_converter(SensorType sensor, Converter converter);
    [[nodiscard]] bool supports(SensorType sensor) const;

    ConversionOutcome dispatch(const ConversionRequest& request) override;

private:
    mutable std::mutex mutex_;
    std::map<SensorType, Converter> converters_;
};

/**
 * @brief Converter that runs an external program on the assembled upload
 *
 * Invoked as: <command> '<input_path>' '<output_dir>' '<SENSOR>'
 * through the shell; exit status 0 is success.
 */
ConverterRegistry::Converter make_command_converter(std::string command);

} // namespace scingest::upload
