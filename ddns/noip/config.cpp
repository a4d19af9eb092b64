/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: No-IP account configuration loading and validation

**************************************************/

#include "config.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ddns/system/user.hpp"
#include "ddns/utils/string.hpp"

namespace fs = std::filesystem;

namespace ddns::noip {

namespace {

auto requireString(const json &element, const char *field, size_t index,
                   const std::string &source) -> std::string {
    auto it = element.find(field);
    if (it == element.end() || !it->is_string() ||
        it->get<std::string>().empty()) {
        THROW_CONFIG_ERROR("Element ", index, " in file '", source,
                           "' has no or invalid '", field, "' field.");
    }
    return it->get<std::string>();
}

auto parseHostnames(const json &element, size_t index,
                    const std::string &source) -> std::vector<Hostname> {
    auto it = element.find("hostnames");
    if (it == element.end() || !it->is_array()) {
        THROW_CONFIG_ERROR("Element ", index, " in file '", source,
                           "' has no or invalid 'hostnames' field.");
    }
    if (it->empty()) {
        THROW_CONFIG_ERROR("Element ", index, " in file '", source,
                           "' has empty 'hostnames' field.");
    }

    std::vector<Hostname> hostnames;
    std::set<std::string> seen;
    for (size_t j = 0; j < it->size(); ++j) {
        const json &value = (*it)[j];
        if (!value.is_string() || utils::isBlank(value.get<std::string>())) {
            THROW_CONFIG_ERROR("Element ", index, " in file '", source,
                               "' has invalid 'hostnames[", j, "]' value.");
        }
        auto hostname = value.get<std::string>();
        if (!seen.insert(hostname).second) {
            THROW_CONFIG_ERROR("Element ", index, " in file '", source,
                               "' has duplicate 'hostnames[", j, "]' value '",
                               hostname, "'.");
        }
        hostnames.push_back(Hostname{std::move(hostname)});
    }
    return hostnames;
}

auto parseIpAddress(const json &element, size_t index,
                    const std::string &source) -> std::optional<IpAddress> {
    auto it = element.find("ipAddress");
    if (it == element.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string() || utils::isBlank(it->get<std::string>())) {
        THROW_CONFIG_ERROR(
            "Element ", index, " in file '", source,
            "' has empty 'ipAddress' field. Can be omitted or be null but not "
            "empty or contain only white spaces.");
    }
    return IpAddress{it->get<std::string>()};
}

}  // namespace

auto DnsUpdateConfigurationElement::toString() const -> std::string {
    std::vector<std::string> names;
    names.reserve(hostnames.size());
    for (const auto &hostname : hostnames) {
        names.push_back(hostname.value);
    }

    std::ostringstream oss;
    oss << "username: '" << username << "' password: *" << password.size()
        << "* hostnames: '" << utils::joinStrings(names, ",")
        << "' ipAddress: ";
    if (ipAddress) {
        oss << "'" << ipAddress->value << "'";
    } else {
        oss << "null";
    }
    return oss.str();
}

auto defaultConfigurationPath() -> fs::path {
    return fs::path(ddns::system::getExecutableDirectory()) / "configs" /
           "noip.com" / "config.json";
}

auto parseConfiguration(std::string_view text, const std::string &source)
    -> DnsUpdateConfiguration {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error &e) {
        THROW_CONFIG_ERROR("Could not load JSON data from file '", source,
                           "': ", e.what());
    }

    if (!document.is_array()) {
        THROW_CONFIG_ERROR("File '", source,
                           "' must contain a JSON array of DNS update info.");
    }
    if (document.empty()) {
        THROW_CONFIG_ERROR("List of DNS update info in file '", source,
                           "' is empty.");
    }

    DnsUpdateConfiguration configuration;
    configuration.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        const json &element = document[i];
        if (!element.is_object()) {
            THROW_CONFIG_ERROR("Element ", i, " in file '", source,
                               "' is not a JSON object.");
        }

        DnsUpdateConfigurationElement entry;
        entry.username = requireString(element, "username", i, source);
        entry.password = requireString(element, "password", i, source);
        entry.hostnames = parseHostnames(element, i, source);
        entry.ipAddress = parseIpAddress(element, i, source);
        configuration.push_back(std::move(entry));
    }

    return configuration;
}

auto loadConfiguration(const fs::path &filename) -> DnsUpdateConfiguration {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        THROW_FILE_NOT_FOUND("Could not find file '", filename.string(), "'.");
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        THROW_CONFIG_ERROR("Could not open file '", filename.string(), "'.");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto configuration = parseConfiguration(buffer.str(), filename.string());

    spdlog::info("Loaded {} DNS update entries from '{}'",
                 configuration.size(), filename.string());
    for (const auto &entry : configuration) {
        spdlog::debug("  {}", entry.toString());
    }
    return configuration;
}

}  // namespace ddns::noip
