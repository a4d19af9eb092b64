/*
 * signal.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Delivers termination signals to a handler on a worker thread

**************************************************/

#ifndef DDNS_SYSTEM_SIGNAL_HPP
#define DDNS_SYSTEM_SIGNAL_HPP

#include <functional>
#include <initializer_list>
#include <thread>
#include <vector>

namespace ddns::system {

using SignalID = int;
using SignalHandler = std::function<void(SignalID)>;

/**
 * @brief Blocks the given signals for the process and hands them to a
 * handler running on a dedicated thread.
 *
 * The handler runs in normal thread context, so it may lock mutexes, log and
 * notify condition variables. Must be constructed before other threads are
 * started so they inherit the signal mask. The previous mask is restored on
 * destruction.
 */
class SignalWatcher {
public:
    /**
     * @throws ddns::error::RuntimeError If the signal mask cannot be changed.
     */
    SignalWatcher(std::initializer_list<SignalID> signals,
                  SignalHandler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher &) = delete;
    auto operator=(const SignalWatcher &) -> SignalWatcher & = delete;

private:
    void watch(std::stop_token stopToken);

    std::vector<SignalID> signals_;
    SignalHandler handler_;
    std::jthread worker_;
};

}  // namespace ddns::system

#endif  // DDNS_SYSTEM_SIGNAL_HPP
