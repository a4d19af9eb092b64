/*
 * ip_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Public IP address discovery with a cached snapshot

**************************************************/

#ifndef DDNS_NOIP_IP_DISCOVERY_HPP
#define DDNS_NOIP_IP_DISCOVERY_HPP

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "ddns/noip/types.hpp"
#include "ddns/storage/storage_container.hpp"
#include "ddns/web/http_client.hpp"

namespace ddns::noip {

/**
 * @brief Source of the host's current public address.
 */
class IpAddressDiscoveryService {
public:
    virtual ~IpAddressDiscoveryService() = default;

    /**
     * @brief Returns the current public address.
     *
     * Never throws; failures are reported with DataSource::None.
     */
    virtual auto getIpAddress() -> IpAddressInfo = 0;
};

// An empty clock means the system clock.
using Clock = std::function<SystemTimePoint()>;

/**
 * @brief Discovery through the No-IP "what is my IP" endpoint.
 *
 * The last successful result is kept in a storage container and reused while
 * it is younger than the freshness window, so the endpoint is probed at most
 * once per window.
 */
class NoipIpAddressDiscoveryService final : public IpAddressDiscoveryService {
public:
    struct Options {
        std::string url = "http://ip1.dynupdate.no-ip.com/";
        std::chrono::seconds freshness = std::chrono::hours(1);
    };

    NoipIpAddressDiscoveryService(
        web::HttpClient &client,
        storage::StorageContainer<CachedIpSnapshot> &cache);
    NoipIpAddressDiscoveryService(
        web::HttpClient &client,
        storage::StorageContainer<CachedIpSnapshot> &cache, Options options,
        Clock clock = {});

    auto getIpAddress() -> IpAddressInfo override;

private:
    auto probe() -> IpAddressInfo;

    web::HttpClient &client_;
    storage::StorageContainer<CachedIpSnapshot> &cache_;
    Options options_;
    Clock clock_;
};

/**
 * @brief Checks that text is a dotted IPv4 or a textual IPv6 address.
 */
[[nodiscard]] auto isIpAddressLiteral(std::string_view text) -> bool;

}  // namespace ddns::noip

#endif  // DDNS_NOIP_IP_DISCOVERY_HPP
