/*
 * updater.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Reconciles configured No-IP hostnames with the public address

**************************************************/

#ifndef DDNS_NOIP_UPDATER_HPP
#define DDNS_NOIP_UPDATER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ddns/noip/config.hpp"
#include "ddns/noip/ip_discovery.hpp"
#include "ddns/noip/types.hpp"
#include "ddns/storage/storage_container.hpp"
#include "ddns/web/http_client.hpp"

namespace ddns::noip {

/**
 * @brief A DNS service the driver loop keeps up to date.
 */
class Updater {
public:
    virtual ~Updater() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Runs one full reconciliation pass.
     */
    virtual void update() = 0;
};

/**
 * @brief What happened to one configuration entry during a pass.
 */
enum class EntryOutcome {
    Skipped,    ///< Every hostname was current, nothing was sent.
    Committed,  ///< The response was applied to the hostname map.
    Aborted,    ///< Transport failure, non-2xx status or malformed response.
    UserError,  ///< Applied, but at least one hostname needs operator action.
    Unconfirmed,  ///< Answered, but no hostname was confirmed; map unchanged.
};

[[nodiscard]] auto toString(EntryOutcome outcome) -> const char *;

/**
 * @brief Builds the client identification sent to the provider:
 * "<name>/<platform>-v<version> <contact>".
 *
 * @throws ddns::error::InvalidArgument If @p contact is blank.
 */
[[nodiscard]] auto buildUserAgent(std::string_view version,
                                  std::string_view contact) -> std::string;

class NoipDnsUpdater final : public Updater {
public:
    struct Options {
        std::string updateUrl = "https://dynupdate.no-ip.com/nic/update";
    };

    NoipDnsUpdater(IpAddressDiscoveryService &discovery,
                   web::HttpClient &client,
                   storage::StorageContainer<HostnameIpMap> &database,
                   DnsUpdateConfiguration configuration);
    NoipDnsUpdater(IpAddressDiscoveryService &discovery,
                   web::HttpClient &client,
                   storage::StorageContainer<HostnameIpMap> &database,
                   DnsUpdateConfiguration configuration, Options options);

    [[nodiscard]] auto name() const -> std::string override;

    void update() override;

    /**
     * @brief Processes one entry against the given address and map.
     *
     * Confirmed hostnames are written to @p map; the map is not persisted
     * here.
     */
    auto updateElement(const DnsUpdateConfigurationElement &element,
                       const IpAddressInfo &info, HostnameIpMap &map)
        -> EntryOutcome;

    /**
     * @brief Decides whether a hostname has to be sent to the provider.
     *
     * @param detected The discovered public address.
     * @param stored The address last confirmed for the hostname.
     * @param desired The configured override.
     */
    [[nodiscard]] static auto shouldUpdate(
        const std::optional<IpAddress> &detected,
        const std::optional<IpAddress> &stored,
        const std::optional<IpAddress> &desired) -> bool;

private:
    IpAddressDiscoveryService &discovery_;
    web::HttpClient &client_;
    storage::StorageContainer<HostnameIpMap> &database_;
    DnsUpdateConfiguration configuration_;
    Options options_;
};

}  // namespace ddns::noip

#endif  // DDNS_NOIP_UPDATER_HPP
