/*
 * device_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Owns and wires the device core: adapters, registry, discovery
and the event channel consumed by the presentation layer

**************************************************/

#ifndef HEARTH_APP_DEVICE_MANAGER_HPP
#define HEARTH_APP_DEVICE_MANAGER_HPP

#include <future>
#include <memory>
#include <vector>

#include "config/config_provider.hpp"
#include "device/adapter/adapter_registry.hpp"
#include "device/discovery/discovery_orchestrator.hpp"
#include "device/events/device_event_bus.hpp"
#include "device/events/event_queue.hpp"
#include "device/registry/device_registry.hpp"

namespace hearth::app {

/**
 * @brief Entry point for a presentation layer
 *
 * The owner drains events() on its own thread. Everything else runs on the
 * registry workers and the discovery threads.
 */
class DeviceManager {
public:
    explicit DeviceManager(std::shared_ptr<config::ConfigProvider> config);
    ~DeviceManager();

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    /**
     * @brief Register the built-in adapters and probes and start discovery
     */
    void start();

    void stop();

    // ==================== Presentation API ====================

    [[nodiscard]] auto events() -> device::EventQueue& { return queue_; }

    [[nodiscard]] auto snapshot() const -> std::vector<device::DeviceSnapshot>;

    auto invoke(const device::DeviceId& id, device::Command command)
        -> std::future<device::DeviceVoidResult>;

    void rescan();

    /**
     * @brief Re-read the configuration and apply it
     *
     * Logging, registry tunables and adapter credentials take effect at
     * once; static host lists are picked up by the rescan that follows.
     */
    auto reload() -> device::DeviceVoidResult;

    [[nodiscard]] auto probeStatus() const
        -> std::vector<device::ProbeStatus>;

    [[nodiscard]] auto registry() -> device::DeviceRegistry& {
        return *registry_;
    }

    [[nodiscard]] auto orchestrator() -> device::DiscoveryOrchestrator& {
        return *orchestrator_;
    }

private:
    void registerProtocols();

    std::shared_ptr<config::ConfigProvider> config_;
    device::DeviceEventBus bus_;
    device::EventQueue queue_;
    std::shared_ptr<device::AdapterRegistry> adapters_;
    std::unique_ptr<device::DeviceRegistry> registry_;
    std::unique_ptr<device::DiscoveryOrchestrator> orchestrator_;
    bool started_ = false;
};

}  // namespace hearth::app

#endif  // HEARTH_APP_DEVICE_MANAGER_HPP
