/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup for the ddns daemon

**************************************************/

#ifndef DDNS_LOG_LOGGING_HPP
#define DDNS_LOG_LOGGING_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace ddns::log {

/**
 * @brief Options for the process-wide logger.
 */
struct LoggingOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string filePath;  ///< Empty means console only.
    size_t maxFileSize = 5 * 1024 * 1024;
    size_t maxFiles = 3;
};

/**
 * @brief Parses a level name such as "debug" or "WARN".
 *
 * Accepts trace, debug, info, warn/warning, error/err, critical/fatal and off,
 * case-insensitively.
 *
 * @throws ddns::error::InvalidArgument If the name is unknown.
 */
[[nodiscard]] auto parseLevel(std::string_view name)
    -> spdlog::level::level_enum;

/**
 * @brief Installs the default spdlog logger.
 *
 * Always logs to a colored stdout sink; when a file path is given, a rotating
 * file sink is added alongside it.
 *
 * @throws ddns::error::RuntimeError If the file sink cannot be created.
 */
void setupLogging(const LoggingOptions &options);

}  // namespace ddns::log

#endif  // DDNS_LOG_LOGGING_HPP
