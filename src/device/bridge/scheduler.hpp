/*
 * scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Single-thread timer service for grace periods and polling

**************************************************/

#ifndef HEARTH_DEVICE_BRIDGE_SCHEDULER_HPP
#define HEARTH_DEVICE_BRIDGE_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace hearth::device {

using TimerId = std::uint64_t;

/**
 * @brief Runs short callbacks after a delay on one background thread
 *
 * Callbacks must not block; device I/O belongs on the DeviceExecutor.
 */
class Scheduler {
public:
    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Call fn once after delay
     * @return Id usable with cancel()
     */
    auto scheduleAfter(std::chrono::milliseconds delay,
                       std::function<void()> fn) -> TimerId;

    /**
     * @brief Cancel a pending timer; no-op if it already fired
     * @return true if the callback will not run
     */
    auto cancel(TimerId id) -> bool;

    [[nodiscard]] auto pendingCount() const -> std::size_t;

    /**
     * @brief Cancel all timers and join the thread
     */
    void stop();

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>>
        timers_;
    TimerId nextId_{1};
    bool stopped_{false};
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_BRIDGE_SCHEDULER_HPP
