/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Default logger setup from LoggingConfig

**************************************************/

#ifndef DOCSTORE_LOGGING_LOGGING_HPP
#define DOCSTORE_LOGGING_LOGGING_HPP

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace docstore::logging {

[[nodiscard]] spdlog::level::level_enum toSpdlogLevel(config::LogLevel level);

/**
 * @brief Install the default spdlog logger.
 *
 * Builds a console sink and, when enabled, a basic file sink at
 * `<logDir>/<logFilename>.log`, each with its own level. A log file that
 * cannot be opened is reported as a warning and logging continues without
 * it. Calling it again replaces the previous default logger.
 */
void initialize(const config::LoggingConfig& config);

/**
 * @brief Flush the default logger.
 */
void flush();

}  // namespace docstore::logging

#endif  // DOCSTORE_LOGGING_LOGGING_HPP
