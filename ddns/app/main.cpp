/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: No-IP dynamic DNS updater entry point

**************************************************/

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "ddns/app/options.hpp"
#include "ddns/async/periodic_runner.hpp"
#include "ddns/log/logging.hpp"
#include "ddns/noip/config.hpp"
#include "ddns/noip/ip_discovery.hpp"
#include "ddns/noip/updater.hpp"
#include "ddns/storage/storage_container.hpp"
#include "ddns/system/signal.hpp"
#include "ddns/web/http_client.hpp"

#ifndef DDNS_VERSION
#define DDNS_VERSION "0.0.0"
#endif

using namespace ddns;

int main(int argc, char **argv) {
    const std::string programName = argc > 0 ? argv[0] : "ddns-updater";

    app::AppOptions options;
    try {
        options = app::parseOptions(argc, argv);
    } catch (const error::InvalidArgument &e) {
        std::cerr << e.getMessage() << "\n\n" << app::usage(programName);
        return EXIT_FAILURE;
    }

    if (options.showHelp) {
        std::cout << app::usage(programName);
        return EXIT_SUCCESS;
    }
    if (options.showVersion) {
        std::cout << "ddns-updater " << DDNS_VERSION << '\n';
        return EXIT_SUCCESS;
    }

    try {
        log::setupLogging(options.logging);
        spdlog::info("ddns-updater {} starting", DDNS_VERSION);

        auto configuration = noip::loadConfiguration(options.configPath);

        storage::StorageContainer<noip::CachedIpSnapshot> ipCache(
            options.storageRoot, {"noip", "settings.json"});
        storage::StorageContainer<noip::HostnameIpMap> database(
            options.storageRoot, {"noip", "db.json"});

        web::HttpClientOptions httpOptions;
        httpOptions.userAgent =
            noip::buildUserAgent(DDNS_VERSION, options.contact);
        web::CurlHttpClient httpClient(httpOptions);

        noip::NoipIpAddressDiscoveryService discovery(httpClient, ipCache);
        noip::NoipDnsUpdater updater(discovery, httpClient, database,
                                     std::move(configuration));

        async::PeriodicRunner runner(options.interval);
        runner.addJob({updater.name(), [&updater] { updater.update(); }});

        if (options.once) {
            runner.runOnce();
            return EXIT_SUCCESS;
        }

        system::SignalWatcher signals({SIGINT, SIGTERM},
                                      [&runner](system::SignalID) {
                                          spdlog::info("Shutting down");
                                          runner.stop();
                                      });
        runner.run();
    } catch (const std::exception &e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}
