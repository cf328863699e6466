#pragma once

#include "scingest/config/service_config.hpp"

namespace scingest {

/**
 * @brief Install the process-wide spdlog logger
 *
 * SCINGEST_LOG_LEVEL and SCINGEST_LOG_PATTERN take precedence over `config`.
 * An unknown level name falls back to info.
 */
void configure_logging(const LoggingConfig& config);

void shutdown_logging();

} // namespace scingest
