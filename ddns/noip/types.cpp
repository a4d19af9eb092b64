/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include "ddns/error/exception.hpp"

namespace ddns::noip {

auto toString(DataSource source) -> const char * {
    switch (source) {
        case DataSource::None:
            return "none";
        case DataSource::Cache:
            return "cache";
        case DataSource::Network:
            return "network";
    }
    return "unknown";
}

void to_json(json &j, const CachedIpSnapshot &snapshot) {
    j = json{{"ipAddress", snapshot.ipAddress.value},
             {"lastTimeChecked", utils::toIsoString(snapshot.lastTimeChecked)}};
}

void from_json(const json &j, CachedIpSnapshot &snapshot) {
    snapshot.ipAddress.value = j.at("ipAddress").get<std::string>();

    auto text = j.at("lastTimeChecked").get<std::string>();
    auto timePoint = utils::parseIsoString(text);
    if (!timePoint) {
        THROW_INVALID_ARGUMENT("Invalid 'lastTimeChecked' timestamp '", text,
                               "'");
    }
    snapshot.lastTimeChecked = *timePoint;
}

auto HostnameIpMap::find(const Hostname &hostname) const
    -> std::optional<IpAddress> {
    auto it = entries_.find(hostname);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HostnameIpMap::set(const Hostname &hostname, const IpAddress &address) {
    entries_[hostname] = address;
}

void to_json(json &j, const HostnameIpMap &map) {
    j = json::object();
    for (const auto &[hostname, address] : map.entries()) {
        j[hostname.value] = address.value;
    }
}

void from_json(const json &j, HostnameIpMap &map) {
    if (!j.is_object()) {
        THROW_INVALID_ARGUMENT("Hostname database must be a JSON object");
    }
    map = HostnameIpMap{};
    for (const auto &[key, value] : j.items()) {
        map.set(Hostname{key}, IpAddress{value.get<std::string>()});
    }
}

}  // namespace ddns::noip
