/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Command line options of the updater

**************************************************/

#ifndef DDNS_APP_OPTIONS_HPP
#define DDNS_APP_OPTIONS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ddns/log/logging.hpp"

namespace ddns::app {

struct AppOptions {
    std::filesystem::path configPath;
    std::filesystem::path storageRoot;
    std::chrono::hours interval{6};
    bool once = false;
    log::LoggingOptions logging;
    std::string contact;
    bool showHelp = false;
    bool showVersion = false;
};

/**
 * @brief Parses command line arguments, program name excluded.
 *
 * Options take their value either as the next argument or after '='
 * ("--config x.json" or "--config=x.json"). Unset paths are filled with
 * their defaults. --contact is mandatory unless help or version is requested.
 *
 * @throws ddns::error::InvalidArgument On an unknown option, a missing value,
 * a value that cannot be parsed, an interval outside 1 to 8760 hours or a
 * missing contact.
 */
[[nodiscard]] auto parseOptions(const std::vector<std::string> &args)
    -> AppOptions;

[[nodiscard]] auto parseOptions(int argc, char **argv) -> AppOptions;

[[nodiscard]] auto usage(const std::string &programName) -> std::string;

}  // namespace ddns::app

#endif  // DDNS_APP_OPTIONS_HPP
