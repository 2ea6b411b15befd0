/*
 * device_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bounded worker pool with per-device FIFO lanes

**************************************************/

#include "device_executor.hpp"

#include <vector>

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

namespace hearth::device {

namespace {

void cancelAll(std::vector<DeviceJob>& jobs) {
    for (auto& job : jobs) {
        if (job.cancel) {
            job.cancel();
        }
    }
}

}  // namespace

DeviceExecutor::DeviceExecutor(std::size_t workerThreads)
    : pool_(workerThreads == 0 ? 1 : workerThreads) {
    spdlog::debug("DeviceExecutor: started {} workers",
                  workerThreads == 0 ? 1 : workerThreads);
}

DeviceExecutor::~DeviceExecutor() { shutdown(); }

void DeviceExecutor::submit(const DeviceId& id, DeviceJob job) {
    std::vector<DeviceJob> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            dropped.push_back(std::move(job));
        } else {
            auto& lane = lanes_[id];
            if (!job.supersedeKey.empty()) {
                for (auto it = lane.queue.begin(); it != lane.queue.end();) {
                    if (it->supersedeKey == job.supersedeKey) {
                        dropped.push_back(std::move(*it));
                        it = lane.queue.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            lane.queue.push_back(std::move(job));
            if (!lane.running) {
                dispatchLocked(id, lane);
            }
        }
    }
    if (!dropped.empty()) {
        spdlog::debug("DeviceExecutor: {} superseded {} queued job(s)",
                      id.str(), dropped.size());
    }
    cancelAll(dropped);
}

auto DeviceExecutor::submitIfIdle(const DeviceId& id, DeviceJob job) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return false;
    }
    auto it = lanes_.find(id);
    if (it != lanes_.end() &&
        (it->second.running || !it->second.queue.empty())) {
        return false;
    }
    auto& lane = lanes_[id];
    lane.queue.push_back(std::move(job));
    dispatchLocked(id, lane);
    return true;
}

auto DeviceExecutor::isBusy(const DeviceId& id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(id);
    return it != lanes_.end() &&
           (it->second.running || !it->second.queue.empty());
}

auto DeviceExecutor::queuedCount(const DeviceId& id) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(id);
    return it == lanes_.end() ? 0 : it->second.queue.size();
}

void DeviceExecutor::cancelQueued(const DeviceId& id) {
    std::vector<DeviceJob> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(id);
        if (it == lanes_.end()) {
            return;
        }
        for (auto& job : it->second.queue) {
            dropped.push_back(std::move(job));
        }
        it->second.queue.clear();
        if (!it->second.running) {
            lanes_.erase(it);
        }
    }
    cancelAll(dropped);
}

void DeviceExecutor::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    std::vector<DeviceJob> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, lane] : lanes_) {
            for (auto& job : lane.queue) {
                dropped.push_back(std::move(job));
            }
            lane.queue.clear();
        }
    }
    cancelAll(dropped);
    pool_.join();
    spdlog::debug("DeviceExecutor: stopped");
}

void DeviceExecutor::dispatchLocked(const DeviceId& id, Lane& lane) {
    if (lane.queue.empty()) {
        return;
    }
    lane.running = true;
    auto job = std::move(lane.queue.front());
    lane.queue.pop_front();
    boost::asio::post(pool_, [this, id, job = std::move(job)]() mutable {
        runJob(id, std::move(job));
    });
}

void DeviceExecutor::runJob(const DeviceId& id, DeviceJob job) {
    try {
        if (job.run) {
            job.run();
        }
    } catch (const std::exception& e) {
        spdlog::error("DeviceExecutor: job for {} threw: {}", id.str(),
                      e.what());
    }

    std::vector<DeviceJob> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(id);
        if (it == lanes_.end()) {
            return;
        }
        auto& lane = it->second;
        lane.running = false;
        if (stopped_) {
            for (auto& queued : lane.queue) {
                dropped.push_back(std::move(queued));
            }
            lanes_.erase(it);
        } else if (lane.queue.empty()) {
            lanes_.erase(it);
        } else {
            dispatchLocked(id, lane);
        }
    }
    cancelAll(dropped);
}

}  // namespace hearth::device
