/*
 * signal.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Delivers termination signals to a handler on a worker thread

**************************************************/

#include "signal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>

#include <pthread.h>

#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"

namespace ddns::system {

namespace {

constexpr long POLL_INTERVAL_NS = 200'000'000;

auto makeSet(const std::vector<SignalID> &signals) -> sigset_t {
    sigset_t set;
    sigemptyset(&set);
    for (auto signal : signals) {
        sigaddset(&set, signal);
    }
    return set;
}

}  // namespace

SignalWatcher::SignalWatcher(std::initializer_list<SignalID> signals,
                             SignalHandler handler)
    : signals_(signals), handler_(std::move(handler)) {
    sigset_t set = makeSet(signals_);
    if (int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
        THROW_RUNTIME_ERROR("Failed to block signals: ", std::strerror(rc));
    }
    worker_ = std::jthread([this](std::stop_token stopToken) {
        watch(std::move(stopToken));
    });
}

SignalWatcher::~SignalWatcher() {
    worker_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    sigset_t set = makeSet(signals_);
    if (int rc = pthread_sigmask(SIG_UNBLOCK, &set, nullptr); rc != 0) {
        spdlog::warn("Failed to unblock signals: {}", std::strerror(rc));
    }
}

void SignalWatcher::watch(std::stop_token stopToken) {
    const sigset_t set = makeSet(signals_);
    const timespec timeout{0, POLL_INTERVAL_NS};

    while (!stopToken.stop_requested()) {
        int signal = sigtimedwait(&set, nullptr, &timeout);
        if (signal < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("Waiting for signals failed: {}",
                              std::strerror(errno));
                return;
            }
            continue;
        }

        spdlog::info("Received signal {} ({})", signal, strsignal(signal));
        try {
            handler_(signal);
        } catch (const std::exception &e) {
            spdlog::error("Exception in signal handler for signal {}: {}",
                          signal, e.what());
        }
    }
}

}  // namespace ddns::system
