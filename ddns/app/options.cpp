/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Command line options of the updater

**************************************************/

#include "options.hpp"

#include <charconv>
#include <sstream>

#include "ddns/error/exception.hpp"
#include "ddns/noip/config.hpp"
#include "ddns/storage/storage_container.hpp"
#include "ddns/utils/string.hpp"

namespace ddns::app {

namespace {

constexpr long MAX_INTERVAL_HOURS = 24 * 365;

auto parseHours(const std::string &value) -> std::chrono::hours {
    long hours = 0;
    const char *first = value.data();
    const char *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, hours);
    if (ec != std::errc() || ptr != last || hours <= 0 ||
        hours > MAX_INTERVAL_HOURS) {
        THROW_INVALID_ARGUMENT("Invalid value for --interval-hours: '", value,
                               "', expected an integer between 1 and ",
                               MAX_INTERVAL_HOURS);
    }
    return std::chrono::hours(hours);
}

}  // namespace

auto parseOptions(const std::vector<std::string> &args) -> AppOptions {
    AppOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string name = args[i];
        std::optional<std::string> inlineValue;
        if (auto pos = name.find('='); name.starts_with("--") &&
                                       pos != std::string::npos) {
            inlineValue = name.substr(pos + 1);
            name.resize(pos);
        }

        auto value = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= args.size()) {
                THROW_INVALID_ARGUMENT("Option ", name, " requires a value");
            }
            return args[++i];
        };
        auto noValue = [&] {
            if (inlineValue) {
                THROW_INVALID_ARGUMENT("Option ", name, " takes no value");
            }
        };

        if (name == "-h" || name == "--help") {
            noValue();
            options.showHelp = true;
        } else if (name == "-v" || name == "--version") {
            noValue();
            options.showVersion = true;
        } else if (name == "--once") {
            noValue();
            options.once = true;
        } else if (name == "--config") {
            options.configPath = value();
        } else if (name == "--storage-dir") {
            options.storageRoot = value();
        } else if (name == "--interval-hours") {
            options.interval = parseHours(value());
        } else if (name == "--log-level") {
            options.logging.level = log::parseLevel(value());
        } else if (name == "--log-file") {
            options.logging.filePath = value();
        } else if (name == "--contact") {
            options.contact = value();
        } else {
            THROW_INVALID_ARGUMENT("Unknown option '", name, "'");
        }
    }

    if (!options.showHelp && !options.showVersion &&
        utils::isBlank(options.contact)) {
        THROW_INVALID_ARGUMENT(
            "Option --contact is required: the provider blocks clients that "
            "do not identify an operator contact");
    }

    if (options.configPath.empty()) {
        options.configPath = noip::defaultConfigurationPath();
    }
    if (options.storageRoot.empty()) {
        options.storageRoot = storage::defaultStorageRoot();
    }
    return options;
}

auto parseOptions(int argc, char **argv) -> AppOptions {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseOptions(args);
}

auto usage(const std::string &programName) -> std::string {
    std::ostringstream oss;
    oss << "Usage: " << programName << " [options]\n"
        << "Options:\n"
        << "  --config PATH          Provider configuration file\n"
        << "                         (default: <exe dir>/configs/noip.com/"
           "config.json)\n"
        << "  --storage-dir DIR      State directory (default: "
           "$HOME/.dnsupdater)\n"
        << "  --interval-hours N     Hours between passes (default: 6)\n"
        << "  --once                 Run a single pass and exit\n"
        << "  --log-level LEVEL      trace, debug, info, warn, error, "
           "critical or off\n"
        << "  --log-file PATH        Also log to a rotating file\n"
        << "  --contact EMAIL        Operator contact sent to the provider in "
           "the User-Agent\n"
        << "                         (required)\n"
        << "  -h, --help             Show this help message\n"
        << "  -v, --version          Show the version\n";
    return oss.str();
}

}  // namespace ddns::app
