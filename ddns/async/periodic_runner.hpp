/*
 * periodic_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Runs a set of jobs immediately and then on a fixed interval

**************************************************/

#ifndef DDNS_ASYNC_PERIODIC_RUNNER_HPP
#define DDNS_ASYNC_PERIODIC_RUNNER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ddns::async {

/**
 * @brief A named unit of work run once per pass.
 */
struct PeriodicJob {
    std::string name;
    std::function<void()> run;
};

/**
 * @brief Sequential driver loop.
 *
 * A pass runs every job in registration order on the calling thread. An
 * exception thrown by a job is logged and the remaining jobs still run. The
 * wait between passes can be cut short from any thread with stop(); a pass
 * in progress always completes.
 */
class PeriodicRunner {
public:
    // Keeps the wait deadline representable on the steady clock.
    static constexpr std::chrono::hours MAX_INTERVAL{24 * 365 * 10};

    /**
     * @throws ddns::error::InvalidArgument If the interval is not positive or
     * exceeds MAX_INTERVAL.
     */
    explicit PeriodicRunner(std::chrono::milliseconds interval);

    PeriodicRunner(const PeriodicRunner &) = delete;
    auto operator=(const PeriodicRunner &) -> PeriodicRunner & = delete;

    /**
     * @throws ddns::error::InvalidArgument If the job has no callable.
     */
    void addJob(PeriodicJob job);

    /**
     * @brief Runs a single pass.
     */
    void runOnce();

    /**
     * @brief Runs passes until stop() is called. The first pass starts
     * immediately.
     */
    void run();

    void stop();

    [[nodiscard]] auto isStopped() const -> bool;
    [[nodiscard]] auto passCount() const -> size_t;
    [[nodiscard]] auto interval() const -> std::chrono::milliseconds {
        return interval_;
    }

private:
    std::chrono::milliseconds interval_;
    std::vector<PeriodicJob> jobs_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    size_t passes_ = 0;
};

}  // namespace ddns::async

#endif  // DDNS_ASYNC_PERIODIC_RUNNER_HPP
