/*
 * ip_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Public IP address discovery with a cached snapshot

**************************************************/

#include "ip_discovery.hpp"

#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <spdlog/spdlog.h>

#include "ddns/utils/string.hpp"

namespace ddns::noip {

auto isIpAddressLiteral(std::string_view text) -> bool {
    if (text.empty() || text.size() >= INET6_ADDRSTRLEN) {
        return false;
    }
    std::string address(text);
    in_addr v4{};
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return true;
    }
    in6_addr v6{};
    return inet_pton(AF_INET6, address.c_str(), &v6) == 1;
}

NoipIpAddressDiscoveryService::NoipIpAddressDiscoveryService(
    web::HttpClient &client, storage::StorageContainer<CachedIpSnapshot> &cache)
    : NoipIpAddressDiscoveryService(client, cache, Options{}) {}

NoipIpAddressDiscoveryService::NoipIpAddressDiscoveryService(
    web::HttpClient &client, storage::StorageContainer<CachedIpSnapshot> &cache,
    Options options, Clock clock)
    : client_(client),
      cache_(cache),
      options_(std::move(options)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

auto NoipIpAddressDiscoveryService::getIpAddress() -> IpAddressInfo {
    IpAddressInfo cached;
    if (auto snapshot = cache_.get()) {
        cached = IpAddressInfo(snapshot->ipAddress, snapshot->lastTimeChecked,
                               DataSource::Cache);
    }

    const auto now = clock_();
    if (cached.source() == DataSource::None ||
        cached.lastChecked() <= now - options_.freshness) {
        return probe();
    }

    spdlog::debug("Using cached IP address {} checked at {}",
                  cached.address()->value,
                  utils::toIsoString(cached.lastChecked()));
    return cached;
}

auto NoipIpAddressDiscoveryService::probe() -> IpAddressInfo {
    web::HttpResponse response;
    try {
        response = client_.get(web::HttpRequest{options_.url, {}, {}});
    } catch (const std::exception &e) {
        spdlog::warn("Failed to retrieve IP address from {}: {}",
                     options_.url, e.what());
        return IpAddressInfo::none();
    }

    if (!response.isSuccess()) {
        spdlog::error("Failed to retrieve IP address. Status code: {}, body: {}",
                      response.statusCode, response.body);
        return IpAddressInfo::none();
    }

    auto body = std::string(utils::trim(response.body));
    if (!isIpAddressLiteral(body)) {
        spdlog::error("Discovery endpoint returned an invalid address: '{}'",
                      body);
        return IpAddressInfo::none();
    }

    const auto now = clock_();
    IpAddress address{body};
    if (!cache_.set(CachedIpSnapshot{address, now})) {
        spdlog::warn("Could not store IP address {} in cache", body);
    }

    spdlog::info("Detected public IP address {}", body);
    return IpAddressInfo(address, now, DataSource::Network);
}

}  // namespace ddns::noip
