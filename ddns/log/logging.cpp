/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup for the ddns daemon

**************************************************/

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"

namespace ddns::log {

auto parseLevel(std::string_view name) -> spdlog::level::level_enum {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;

    THROW_INVALID_ARGUMENT("Unknown log level '", name, "'");
}

void setupLogging(const LoggingOptions &options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.filePath.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.filePath, options.maxFileSize, options.maxFiles));
        } catch (const spdlog::spdlog_ex &e) {
            THROW_RUNTIME_ERROR("Failed to open log file '", options.filePath,
                                "': ", e.what());
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>("ddns", sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(std::move(logger));
}

}  // namespace ddns::log
