/*
 * scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Single-thread timer service for grace periods and polling

**************************************************/

#include "scheduler.hpp"

#include <spdlog/spdlog.h>

namespace hearth::device {

Scheduler::Scheduler()
    : work_(boost::asio::make_work_guard(ioc_)),
      thread_([this] { ioc_.run(); }) {}

Scheduler::~Scheduler() { stop(); }

auto Scheduler::scheduleAfter(std::chrono::milliseconds delay,
                              std::function<void()> fn) -> TimerId {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return 0;
    }
    auto id = nextId_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay);
    timers_[id] = timer;
    timer->async_wait([this, id, timer, fn = std::move(fn)](
                          const boost::system::error_code& ec) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timers_.erase(id);
        }
        if (ec) {
            return;
        }
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("Scheduler: timer {} callback threw: {}", id,
                          e.what());
        }
    });
    return id;
}

auto Scheduler::cancel(TimerId id) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    auto cancelled = it->second->cancel() > 0;
    timers_.erase(it);
    return cancelled;
}

auto Scheduler::pendingCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (auto& [id, timer] : timers_) {
            timer->cancel();
        }
        timers_.clear();
    }
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace hearth::device
