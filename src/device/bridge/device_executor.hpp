/*
 * device_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bounded worker pool with per-device FIFO lanes

**************************************************/

#ifndef HEARTH_DEVICE_BRIDGE_DEVICE_EXECUTOR_HPP
#define HEARTH_DEVICE_BRIDGE_DEVICE_EXECUTOR_HPP

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>

#include "device/model/device_types.hpp"

namespace hearth::device {

/**
 * @brief Unit of device I/O
 */
struct DeviceJob {
    std::function<void()> run;
    // Called instead of run when the job is dropped before it started
    std::function<void()> cancel;
    // Queued jobs with the same non-empty key are replaced by newer ones
    std::string supersedeKey;
};

/**
 * @brief Runs device I/O off the calling thread
 *
 * A fixed pool of workers caps concurrent outbound connections. Jobs for one
 * device run one at a time in submission order; jobs for different devices
 * run independently. A queued job can be superseded or cancelled, a running
 * job always runs to completion.
 */
class DeviceExecutor {
public:
    explicit DeviceExecutor(std::size_t workerThreads);
    ~DeviceExecutor();

    DeviceExecutor(const DeviceExecutor&) = delete;
    DeviceExecutor& operator=(const DeviceExecutor&) = delete;

    /**
     * @brief Queue a job behind earlier jobs for the same device
     *
     * Queued jobs sharing job.supersedeKey are dropped through their cancel
     * callback. After shutdown the job is cancelled immediately.
     */
    void submit(const DeviceId& id, DeviceJob job);

    /**
     * @brief Queue a job only if the device has nothing running or queued
     * @return false if the job was not queued (its cancel is not called)
     */
    auto submitIfIdle(const DeviceId& id, DeviceJob job) -> bool;

    [[nodiscard]] auto isBusy(const DeviceId& id) const -> bool;

    [[nodiscard]] auto queuedCount(const DeviceId& id) const -> std::size_t;

    /**
     * @brief Cancel every queued job for a device
     */
    void cancelQueued(const DeviceId& id);

    /**
     * @brief Cancel queued jobs and wait for running ones
     */
    void shutdown();

private:
    struct Lane {
        std::deque<DeviceJob> queue;
        bool running = false;
    };

    // Requires mutex_ held; moves the next job of the lane onto the pool
    void dispatchLocked(const DeviceId& id, Lane& lane);

    void runJob(const DeviceId& id, DeviceJob job);

    boost::asio::thread_pool pool_;
    mutable std::mutex mutex_;
    std::unordered_map<DeviceId, Lane> lanes_;
    std::atomic<bool> stopped_{false};
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_BRIDGE_DEVICE_EXECUTOR_HPP
