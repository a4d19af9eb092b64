/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: No-IP account configuration loading and validation

**************************************************/

#ifndef DDNS_NOIP_CONFIG_HPP
#define DDNS_NOIP_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ddns/error/exception.hpp"
#include "ddns/noip/types.hpp"

class ConfigError : public ddns::error::Exception {
public:
    using ddns::error::Exception::Exception;
};

#define THROW_CONFIG_ERROR(...)                                       \
    throw ConfigError(DDNS_FILE_NAME, DDNS_FILE_LINE, DDNS_FUNC_NAME, \
                      __VA_ARGS__)

namespace ddns::noip {

/**
 * @brief One provider account and the hostnames it keeps up to date.
 */
struct DnsUpdateConfigurationElement {
    std::string username;
    std::string password;
    std::vector<Hostname> hostnames;
    std::optional<IpAddress> ipAddress;  ///< Forces "myip" when present.

    /**
     * @brief Loggable description; the password is reduced to its length.
     */
    [[nodiscard]] auto toString() const -> std::string;
};

using DnsUpdateConfiguration = std::vector<DnsUpdateConfigurationElement>;

/**
 * @brief Returns "<executable dir>/configs/noip.com/config.json".
 */
[[nodiscard]] auto defaultConfigurationPath() -> std::filesystem::path;

/**
 * @brief Parses and validates configuration JSON.
 *
 * The document must be a non-empty array of objects with non-empty "username"
 * and "password" strings, a non-empty "hostnames" array of distinct,
 * non-blank strings and an optional "ipAddress" that is null or a non-blank
 * string.
 *
 * @param text The JSON text.
 * @param source Name used in error messages, usually the file name.
 * @throws ConfigError If the text is not valid JSON or any rule is violated.
 */
[[nodiscard]] auto parseConfiguration(std::string_view text,
                                      const std::string &source)
    -> DnsUpdateConfiguration;

/**
 * @brief Reads and validates a configuration file.
 * @throws ddns::error::FileNotFound If the file does not exist.
 * @throws ConfigError If the file cannot be read or is invalid.
 */
[[nodiscard]] auto loadConfiguration(const std::filesystem::path &filename)
    -> DnsUpdateConfiguration;

}  // namespace ddns::noip

#endif  // DDNS_NOIP_CONFIG_HPP
