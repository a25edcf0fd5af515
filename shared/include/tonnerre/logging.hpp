/**
 * Tonnerre - spdlog setup for the binaries. Library code logs through the default spdlog logger.
 */
#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "tonnerre/config.hpp"

namespace tonnerre
{

    /**
     * Installs a default logger named @p name writing to stdout and, when configured, to a file.
     * Throws std::invalid_argument for an unknown level name.
     */
    std::shared_ptr<spdlog::logger> configure_logging(const LoggingConfig &config, const std::string &name);

} // namespace tonnerre
