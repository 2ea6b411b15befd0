/*
 * discovery_orchestrator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Runs discovery probes and feeds sightings into the registry

**************************************************/

#ifndef HEARTH_DEVICE_DISCOVERY_DISCOVERY_ORCHESTRATOR_HPP
#define HEARTH_DEVICE_DISCOVERY_DISCOVERY_ORCHESTRATOR_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config_provider.hpp"
#include "device/registry/device_registry.hpp"
#include "discovery_probe.hpp"

namespace hearth::device {

/**
 * @brief Outcome of the most recent passes of one probe
 */
struct ProbeStatus {
    Protocol protocol = Protocol::WiZ;
    std::optional<Clock::time_point> lastPass;
    std::size_t passes = 0;
    std::size_t failures = 0;
    std::size_t lastSightings = 0;
    std::optional<DeviceError> lastError;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief One background thread per probe
 *
 * With autoDiscovery enabled every probe runs a pass, sleeps
 * intervalSeconds and repeats. rescan() queues one extra pass per probe
 * regardless of the setting. A probe that fails only records the error in
 * its status; the others keep running.
 *
 * Sightings of the same id inside sightingWindowMs are forwarded to the
 * registry once, unless the address changed. After a successful pass,
 * devices of that protocol that did not answer are handed to
 * DeviceRegistry::markLost. A failed pass never marks anything lost.
 */
class DiscoveryOrchestrator {
public:
    DiscoveryOrchestrator(DeviceRegistry& registry,
                          std::shared_ptr<config::ConfigProvider> config);
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief Add a probe; only valid before start()
     */
    void addProbe(std::unique_ptr<DiscoveryProbe> probe);

    void start();

    /**
     * @brief Request one additional pass of every probe
     */
    void rescan();

    /**
     * @brief Run one pass of every probe on the calling thread
     *
     * Passes of the same probe never overlap; a call that finds a pass in
     * progress waits for it.
     */
    void scanOnce();

    /**
     * @brief Register a device entered by hand
     *
     * Manual devices are never marked lost by discovery.
     */
    void addManual(DeviceDescriptor descriptor);

    [[nodiscard]] auto probeStatus() const -> std::vector<ProbeStatus>;

    void stop();

private:
    struct Worker {
        std::unique_ptr<DiscoveryProbe> probe;
        std::thread thread;
        std::mutex passMutex;
        bool rescanRequested = false;
        ProbeStatus status;
    };

    struct Forwarded {
        std::chrono::steady_clock::time_point at;
        Endpoint address;
    };

    void run(Worker& worker);
    void runPass(Worker& worker);
    void onSighting(const DeviceDescriptor& descriptor,
                    std::chrono::milliseconds window);
    void markMissing(Protocol protocol, const std::set<DeviceId>& seen);

    DeviceRegistry& registry_;
    std::shared_ptr<config::ConfigProvider> config_;
    std::vector<std::unique_ptr<Worker>> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool started_ = false;
    bool stopping_ = false;
    std::set<DeviceId> manual_;

    std::mutex sightingMutex_;
    std::unordered_map<DeviceId, Forwarded> forwarded_;
};

/**
 * @brief Whether the configuration enables a protocol family
 */
[[nodiscard]] auto protocolEnabled(const config::HearthConfig& config,
                                   Protocol protocol) -> bool;

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_DISCOVERY_DISCOVERY_ORCHESTRATOR_HPP
