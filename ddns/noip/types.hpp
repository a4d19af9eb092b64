/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Value types shared by the No-IP discovery and update services

**************************************************/

#ifndef DDNS_NOIP_TYPES_HPP
#define DDNS_NOIP_TYPES_HPP

#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "ddns/utils/time.hpp"

namespace ddns::noip {

using json = nlohmann::json;
using utils::SystemTimePoint;

// Distinct wrappers so a hostname can never be passed where an address is
// expected, and the other way around.
struct Hostname {
    std::string value;

    auto operator<=>(const Hostname &) const = default;
};

struct IpAddress {
    std::string value;

    auto operator<=>(const IpAddress &) const = default;
};

/**
 * @brief Where an IpAddressInfo came from.
 */
enum class DataSource {
    None,     ///< Nothing usable was found.
    Cache,    ///< Read from the stored snapshot.
    Network,  ///< Fetched from the discovery endpoint.
};

[[nodiscard]] auto toString(DataSource source) -> const char *;

/**
 * @brief Result of one discovery call.
 *
 * Valid exactly when an address is present and the source is not None.
 */
class IpAddressInfo {
public:
    IpAddressInfo() = default;
    IpAddressInfo(std::optional<IpAddress> address, SystemTimePoint lastChecked,
                  DataSource source)
        : address_(std::move(address)),
          lastChecked_(lastChecked),
          source_(source) {}

    [[nodiscard]] static auto none() -> IpAddressInfo { return {}; }

    [[nodiscard]] auto address() const -> const std::optional<IpAddress> & {
        return address_;
    }
    [[nodiscard]] auto lastChecked() const -> SystemTimePoint {
        return lastChecked_;
    }
    [[nodiscard]] auto source() const -> DataSource { return source_; }

    [[nodiscard]] auto isValid() const -> bool {
        return address_.has_value() && source_ != DataSource::None;
    }

private:
    std::optional<IpAddress> address_;
    SystemTimePoint lastChecked_{};
    DataSource source_ = DataSource::None;
};

/**
 * @brief On-disk shape of the discovery cache.
 */
struct CachedIpSnapshot {
    IpAddress ipAddress;
    SystemTimePoint lastTimeChecked{};
};

void to_json(json &j, const CachedIpSnapshot &snapshot);
void from_json(const json &j, CachedIpSnapshot &snapshot);

/**
 * @brief Last address pushed to the provider, per hostname.
 *
 * Stored as a flat JSON object mapping hostname to address.
 */
class HostnameIpMap {
public:
    [[nodiscard]] auto find(const Hostname &hostname) const
        -> std::optional<IpAddress>;

    void set(const Hostname &hostname, const IpAddress &address);

    [[nodiscard]] auto size() const -> size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }

    [[nodiscard]] auto entries() const
        -> const std::map<Hostname, IpAddress> & {
        return entries_;
    }

    auto operator==(const HostnameIpMap &) const -> bool = default;

private:
    std::map<Hostname, IpAddress> entries_;
};

void to_json(json &j, const HostnameIpMap &map);
void from_json(const json &j, HostnameIpMap &map);

}  // namespace ddns::noip

#endif  // DDNS_NOIP_TYPES_HPP
