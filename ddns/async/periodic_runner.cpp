/*
 * periodic_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Runs a set of jobs immediately and then on a fixed interval

**************************************************/

#include "periodic_runner.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"

namespace ddns::async {

PeriodicRunner::PeriodicRunner(std::chrono::milliseconds interval)
    : interval_(interval) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("Interval must be positive, got ",
                               interval_.count(), " ms");
    }
    if (interval_ > MAX_INTERVAL) {
        THROW_INVALID_ARGUMENT("Interval must not exceed ", MAX_INTERVAL.count(),
                               " hours, got ", interval_.count(), " ms");
    }
}

void PeriodicRunner::addJob(PeriodicJob job) {
    if (!job.run) {
        THROW_INVALID_ARGUMENT("Job '", job.name, "' has no callable");
    }
    jobs_.push_back(std::move(job));
}

void PeriodicRunner::runOnce() {
    for (auto &job : jobs_) {
        spdlog::info("Running {}", job.name);
        try {
            job.run();
        } catch (const std::exception &e) {
            spdlog::error("{} failed: {}", job.name, e.what());
        }
    }

    std::lock_guard lock(mutex_);
    ++passes_;
}

void PeriodicRunner::run() {
    while (!isStopped()) {
        runOnce();

        std::unique_lock lock(mutex_);
        spdlog::info("Next pass in {} minute(s)",
                     std::chrono::duration_cast<std::chrono::minutes>(interval_)
                         .count());
        if (cv_.wait_for(lock, interval_, [this] { return stopped_; })) {
            break;
        }
    }
    spdlog::info("Periodic runner stopped after {} pass(es)", passCount());
}

void PeriodicRunner::stop() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

auto PeriodicRunner::isStopped() const -> bool {
    std::lock_guard lock(mutex_);
    return stopped_;
}

auto PeriodicRunner::passCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return passes_;
}

}  // namespace ddns::async
