#include "scingest/upload/conversion.hpp"

#include <cstdlib>
#include <exception>
#include <string>

#include <sys/wait.h>

namespace scingest::upload {

void ConverterRegistry::register_converter(SensorType sensor, Converter converter) {
    std::lock_guard lock(mutex_);
    converters_[sensor] = std::move(converter);
}

bool ConverterRegistry::supports(SensorType sensor) const {
    std::lock_guard lock(mutex_);
    return converters_.count(sensor) > 0;
}

ConversionOutcome ConverterRegistry::dispatch(const ConversionRequest& request) {
    Converter converter;
    {
        std::lock_guard lock(mutex_);
        auto it = converters_.find(request.sensor);
        if (it == converters_.end()) {
            return {false, std::string("no converter registered for sensor ") + to_string(request.sensor)};
        }
        converter = it->second;
    }

    try {
        return converter(request);
    } catch (const std::exception& e) {
        return {false, std::string("converter threw: ") + e.what()};
    }
}

namespace {

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

ConverterRegistry::Converter make_command_converter(std::string command) {
    return [command = std::move(command)](const ConversionRequest& request) -> ConversionOutcome {
        const std::string line = command + " " + shell_quote(request.input_path.string()) + " " +
                                 shell_quote(request.output_dir.string()) + " " +
                                 shell_quote(to_string(request.sensor));
        const int status = std::system(line.c_str());
        if (status == -1) {
            return {false, "could not start converter: " + command};
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return {false, "converter exited with status " + std::to_string(code)};
        }
        return {true, "converted by " + command};
    };
}

} // namespace scingest::upload
