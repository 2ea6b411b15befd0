/*
 * discovery_orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Discovery orchestrator implementation

**************************************************/

#include "discovery_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "device/common/device_exceptions.hpp"

namespace hearth::device {

auto ProbeStatus::toJson() const -> json {
    json j = {{"protocol", protocolToString(protocol)},
              {"passes", passes},
              {"failures", failures},
              {"lastSightings", lastSightings},
              {"lastPass", nullptr},
              {"lastError", nullptr}};
    if (lastPass) {
        j["lastPass"] = std::chrono::duration_cast<std::chrono::seconds>(
                            lastPass->time_since_epoch())
                            .count();
    }
    if (lastError) {
        j["lastError"] = lastError->toJson();
    }
    return j;
}

auto protocolEnabled(const config::HearthConfig& config, Protocol protocol)
    -> bool {
    switch (protocol) {
        case Protocol::Chromecast:
            return config.cast.enabled;
        case Protocol::WiZ:
            return config.wiz.enabled;
        case Protocol::Tapo:
            return config.tapo.enabled;
        case Protocol::Tuya:
            return config.tuya.enabled;
    }
    return false;
}

DiscoveryOrchestrator::DiscoveryOrchestrator(
    DeviceRegistry& registry, std::shared_ptr<config::ConfigProvider> config)
    : registry_(registry), config_(std::move(config)) {}

DiscoveryOrchestrator::~DiscoveryOrchestrator() { stop(); }

void DiscoveryOrchestrator::addProbe(std::unique_ptr<DiscoveryProbe> probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw std::logic_error("DiscoveryOrchestrator: probes must be added "
                               "before start()");
    }
    auto worker = std::make_unique<Worker>();
    worker->status.protocol = probe->protocol();
    worker->probe = std::move(probe);
    workers_.push_back(std::move(worker));
}

void DiscoveryOrchestrator::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
        return;
    }
    started_ = true;
    for (auto& worker : workers_) {
        auto* w = worker.get();
        w->thread = std::thread([this, w] { run(*w); });
    }
    spdlog::info("DiscoveryOrchestrator: started {} probe(s)",
                 workers_.size());
}

void DiscoveryOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    spdlog::debug("DiscoveryOrchestrator: stopped");
}

void DiscoveryOrchestrator::rescan() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            worker->rescanRequested = true;
        }
    }
    cv_.notify_all();
    spdlog::info("DiscoveryOrchestrator: rescan requested");
}

void DiscoveryOrchestrator::scanOnce() {
    for (auto& worker : workers_) {
        runPass(*worker);
    }
}

void DiscoveryOrchestrator::addManual(DeviceDescriptor descriptor) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_.insert(descriptor.id);
    }
    spdlog::info("DiscoveryOrchestrator: manual device {} at {}",
                 descriptor.id.str(), descriptor.address.toString());
    registry_.registerDevice(std::move(descriptor));
}

auto DiscoveryOrchestrator::probeStatus() const -> std::vector<ProbeStatus> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProbeStatus> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->status);
    }
    return result;
}

void DiscoveryOrchestrator::run(Worker& worker) {
    using SteadyClock = std::chrono::steady_clock;
    auto nextPass = SteadyClock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopping_) {
                    return;
                }
                if (worker.rescanRequested) {
                    worker.rescanRequested = false;
                    break;
                }
                if (config_->current()->discovery.autoDiscovery) {
                    if (SteadyClock::now() >= nextPass) {
                        break;
                    }
                    cv_.wait_until(lock, nextPass);
                } else {
                    cv_.wait(lock);
                }
            }
        }

        runPass(worker);

        const auto interval = std::max<std::size_t>(
            config_->current()->discovery.intervalSeconds, 1);
        nextPass = SteadyClock::now() + std::chrono::seconds(interval);
    }
}

void DiscoveryOrchestrator::runPass(Worker& worker) {
    std::lock_guard<std::mutex> pass(worker.passMutex);

    const auto config = config_->current();
    const auto protocol = worker.probe->protocol();
    const auto name = protocolToString(protocol);
    if (!protocolEnabled(*config, protocol)) {
        spdlog::debug("DiscoveryOrchestrator: {} disabled, skipping", name);
        return;
    }

    const std::chrono::milliseconds window(config->discovery.probeTimeoutMs);
    const std::chrono::milliseconds sightingWindow(
        config->discovery.sightingWindowMs);

    std::set<DeviceId> seen;
    auto onFound = [&](const DeviceDescriptor& descriptor) {
        if (descriptor.id.empty() || descriptor.protocol != protocol) {
            spdlog::warn("DiscoveryOrchestrator: {} probe reported an "
                         "invalid sighting '{}'",
                         name, descriptor.id.str());
            return;
        }
        seen.insert(descriptor.id);
        onSighting(descriptor, sightingWindow);
    };

    DeviceVoidResult result = success();
    try {
        result = worker.probe->scan(window, onFound);
    } catch (const DeviceException& e) {
        result = failure(e.error());
    } catch (const std::exception& e) {
        result = failure(error::discoveryError(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = worker.status;
        status.lastPass = Clock::now();
        ++status.passes;
        if (result) {
            status.lastSightings = seen.size();
            status.lastError.reset();
        } else {
            ++status.failures;
            status.lastError = result.error();
        }
    }

    if (!result) {
        spdlog::warn("DiscoveryOrchestrator: {} probe failed: {}", name,
                     result.error().toString());
        return;
    }
    spdlog::debug("DiscoveryOrchestrator: {} pass found {} device(s)", name,
                  seen.size());
    markMissing(protocol, seen);
}

void DiscoveryOrchestrator::onSighting(const DeviceDescriptor& descriptor,
                                       std::chrono::milliseconds window) {
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(sightingMutex_);
        auto it = forwarded_.find(descriptor.id);
        if (it != forwarded_.end() && now - it->second.at < window &&
            it->second.address == descriptor.address &&
            registry_.contains(descriptor.id)) {
            return;
        }
        forwarded_[descriptor.id] = Forwarded{now, descriptor.address};
    }
    registry_.registerDevice(descriptor);
}

void DiscoveryOrchestrator::markMissing(Protocol protocol,
                                        const std::set<DeviceId>& seen) {
    std::set<DeviceId> manual;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual = manual_;
    }
    for (const auto& snapshot : registry_.snapshot()) {
        const auto& id = snapshot.descriptor.id;
        if (snapshot.descriptor.protocol != protocol || seen.contains(id) ||
            manual.contains(id)) {
            continue;
        }
        {
            // The next sighting must reach the registry to cancel removal
            std::lock_guard<std::mutex> lock(sightingMutex_);
            forwarded_.erase(id);
        }
        registry_.markLost(id);
    }
}

}  // namespace hearth::device
