#include "scingest/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace scingest {
namespace {

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("SCINGEST_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("SCINGEST_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern.empty() ? "[%H:%M:%S] [%^%l%$] %v" : config.pattern;
}

} // namespace

void configure_logging(const LoggingConfig& config) {
    auto logger = spdlog::get("scingest");
    if (!logger) {
        logger = spdlog::stdout_color_mt("scingest");
    }
    logger->set_pattern(resolve_pattern(config));

    // from_str maps unknown names to "off"
    const std::string level_name = resolve_level(config);
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace scingest
