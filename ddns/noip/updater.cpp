/*
 * updater.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Reconciles configured No-IP hostnames with the public address

**************************************************/

#include "updater.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"
#include "ddns/noip/response_parser.hpp"
#include "ddns/utils/string.hpp"

namespace ddns::noip {

namespace {

constexpr std::string_view CLIENT_NAME = "ddns-updater";

constexpr auto platformIdentifier() -> std::string_view {
#if defined(__linux__) && defined(__x86_64__)
    return "linux-x64";
#elif defined(__linux__) && defined(__aarch64__)
    return "linux-arm64";
#elif defined(__linux__) && defined(__arm__)
    return "linux-arm";
#elif defined(__linux__)
    return "linux";
#elif defined(__APPLE__) && defined(__aarch64__)
    return "osx-arm64";
#elif defined(__APPLE__)
    return "osx-x64";
#elif defined(_WIN64)
    return "win-x64";
#elif defined(_WIN32)
    return "win-x86";
#else
    return "unknown";
#endif
}

}  // namespace

auto toString(EntryOutcome outcome) -> const char * {
    switch (outcome) {
        case EntryOutcome::Skipped:
            return "Skipped";
        case EntryOutcome::Committed:
            return "Committed";
        case EntryOutcome::Aborted:
            return "Aborted";
        case EntryOutcome::UserError:
            return "UserError";
        case EntryOutcome::Unconfirmed:
            return "Unconfirmed";
    }
    return "Unknown";
}

auto buildUserAgent(std::string_view version, std::string_view contact)
    -> std::string {
    if (utils::isBlank(contact)) {
        THROW_INVALID_ARGUMENT("A contact is required in the User-Agent");
    }
    std::string agent(CLIENT_NAME);
    agent += '/';
    agent += platformIdentifier();
    agent += "-v";
    agent += version;
    agent += ' ';
    agent += contact;
    return agent;
}

NoipDnsUpdater::NoipDnsUpdater(IpAddressDiscoveryService &discovery,
                               web::HttpClient &client,
                               storage::StorageContainer<HostnameIpMap> &database,
                               DnsUpdateConfiguration configuration)
    : NoipDnsUpdater(discovery, client, database, std::move(configuration),
                     Options{}) {}

NoipDnsUpdater::NoipDnsUpdater(IpAddressDiscoveryService &discovery,
                               web::HttpClient &client,
                               storage::StorageContainer<HostnameIpMap> &database,
                               DnsUpdateConfiguration configuration,
                               Options options)
    : discovery_(discovery),
      client_(client),
      database_(database),
      configuration_(std::move(configuration)),
      options_(std::move(options)) {}

auto NoipDnsUpdater::name() const -> std::string {
    return "noip.com DNS service";
}

auto NoipDnsUpdater::shouldUpdate(const std::optional<IpAddress> &detected,
                                  const std::optional<IpAddress> &stored,
                                  const std::optional<IpAddress> &desired)
    -> bool {
    if (!detected || !stored) {
        return true;
    }
    if (!desired) {
        return *detected != *stored;
    }
    return *desired != *detected;
}

void NoipDnsUpdater::update() {
    const IpAddressInfo info = discovery_.getIpAddress();
    if (info.isValid()) {
        spdlog::info("Current IP address is {} (source: {})",
                     info.address()->value, toString(info.source()));
    } else {
        spdlog::warn("Current IP address is unknown");
    }

    HostnameIpMap map = database_.get().value_or(HostnameIpMap{});

    size_t committed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    for (const auto &element : configuration_) {
        auto outcome = updateElement(element, info, map);
        spdlog::debug("Entry for '{}' finished: {}", element.username,
                      toString(outcome));

        switch (outcome) {
            case EntryOutcome::Skipped:
                ++skipped;
                continue;
            case EntryOutcome::Aborted:
            case EntryOutcome::Unconfirmed:
                ++failed;
                continue;
            case EntryOutcome::UserError:
                ++failed;
                break;
            case EntryOutcome::Committed:
                ++committed;
                break;
        }

        if (!database_.set(map)) {
            spdlog::error("Could not persist hostname map to {}",
                          database_.path().string());
        }
    }

    spdlog::info("{} pass done: {} updated, {} up to date, {} failed", name(),
                 committed, skipped, failed);
}

auto NoipDnsUpdater::updateElement(const DnsUpdateConfigurationElement &element,
                                   const IpAddressInfo &info,
                                   HostnameIpMap &map) -> EntryOutcome {
    std::vector<Hostname> pending;
    for (const auto &hostname : element.hostnames) {
        if (shouldUpdate(info.address(), map.find(hostname),
                         element.ipAddress)) {
            pending.push_back(hostname);
        }
    }

    if (pending.empty()) {
        spdlog::debug("All hostnames of '{}' are up to date", element.username);
        return EntryOutcome::Skipped;
    }

    std::vector<std::string> names;
    names.reserve(pending.size());
    for (const auto &hostname : pending) {
        names.push_back(hostname.value);
    }

    web::HttpRequest request;
    request.url = options_.updateUrl;
    request.query.emplace_back("hostname", utils::joinStrings(names, ","));
    if (element.ipAddress) {
        request.query.emplace_back("myip", element.ipAddress->value);
    }
    request.credentials =
        web::BasicCredentials{element.username, element.password};

    spdlog::info("Updating {} hostname(s) for '{}': {}", pending.size(),
                 element.username, utils::joinStrings(names, ", "));

    web::HttpResponse response;
    try {
        response = client_.get(request);
    } catch (const std::exception &e) {
        spdlog::error("Update request for '{}' failed: {}", element.username,
                      e.what());
        return EntryOutcome::Aborted;
    }

    if (utils::isBlank(response.body)) {
        spdlog::error("Update request for '{}' returned an empty body (status "
                      "code {})",
                      element.username, response.statusCode);
        return EntryOutcome::Aborted;
    }
    if (!response.isSuccess()) {
        spdlog::error("Update request for '{}' returned status code {}: {}",
                      element.username, response.statusCode, response.body);
        return EntryOutcome::Aborted;
    }

    auto results = parseResponse(response.body);
    if (results.size() != pending.size()) {
        spdlog::error(
            "Server responded with {} line(s) for {} hostname(s), expected one "
            "per hostname. Response: {}",
            results.size(), pending.size(), response.body);
        return EntryOutcome::Aborted;
    }

    bool userError = false;
    size_t confirmed = 0;
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto &hostname = pending[i];
        switch (results[i]) {
            case ServerResponseType::Update:
            case ServerResponseType::NoChange:
                ++confirmed;
                if (info.address()) {
                    map.set(hostname, *info.address());
                }
                spdlog::info("Hostname {}: {}", hostname.value,
                             toString(results[i]));
                break;
            case ServerResponseType::UserError:
                userError = true;
                spdlog::error("Hostname {} was rejected, check the account "
                              "settings of '{}'",
                              hostname.value, element.username);
                break;
            case ServerResponseType::ServerError:
            case ServerResponseType::Unsupported:
                spdlog::warn("Hostname {} was not updated: {}", hostname.value,
                             toString(results[i]));
                break;
        }
    }

    if (userError) {
        return EntryOutcome::UserError;
    }
    if (confirmed == 0) {
        spdlog::warn("No hostname of '{}' was confirmed by the server",
                     element.username);
        return EntryOutcome::Unconfirmed;
    }
    return EntryOutcome::Committed;
}

}  // namespace ddns::noip
