/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Authoritative owner of all known devices and their state

**************************************************/

#ifndef HEARTH_DEVICE_REGISTRY_DEVICE_REGISTRY_HPP
#define HEARTH_DEVICE_REGISTRY_DEVICE_REGISTRY_HPP

#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "config/sections/registry_config.hpp"
#include "device/adapter/adapter_registry.hpp"
#include "device/common/device_result.hpp"
#include "device/events/device_event_bus.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device {

/**
 * @brief Single owner of every DeviceDescriptor / DeviceState pair
 *
 * All reads return copies. Mutations to one device are serialized through a
 * per-device lane of the worker pool; different devices proceed in
 * parallel. Events are published after the internal lock is released.
 *
 * Polling: devices whose adapter has no push channel are polled at the
 * configured interval. A poll is skipped while a command for the device is
 * running or queued. DeviceStateChanged is published only when the polled
 * state differs; DeviceError only when a reachable device stops answering.
 */
class DeviceRegistry {
public:
    DeviceRegistry(std::shared_ptr<AdapterRegistry> adapters,
                   DeviceEventBus& bus, config::RegistryConfig config);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // ==================== Lifecycle ====================

    /**
     * @brief Insert or update a device
     *
     * Publishes DeviceDiscovered on first insert only. Re-registering a
     * device that was marked lost cancels its pending removal.
     *
     * @return true if the device was new
     */
    auto registerDevice(DeviceDescriptor descriptor) -> bool;

    /**
     * @brief Start the grace period for a device missing from discovery
     *
     * Without re-registration before it expires, the entry is removed and
     * DeviceLost is published exactly once.
     */
    void markLost(const DeviceId& id);

    // ==================== Commands ====================

    /**
     * @brief Validate and queue a command
     *
     * Never blocks. The future resolves after the device answered or the
     * error was published:
     * - success: state updated, one DeviceStateChanged published
     * - failure: one DeviceError published, state kept, reachable cleared
     *   for transport errors only
     * - Cancelled: superseded by a later command of the same kind before it
     *   started; nothing published
     */
    auto invoke(const DeviceId& id, Command command)
        -> std::future<DeviceVoidResult>;

    /**
     * @brief Poll a device now unless it is busy
     */
    void pollNow(const DeviceId& id);

    // ==================== Queries ====================

    /**
     * @brief Consistent copy of every entry, ordered by id
     */
    [[nodiscard]] auto snapshot() const -> std::vector<DeviceSnapshot>;

    [[nodiscard]] auto get(const DeviceId& id) const
        -> std::optional<DeviceSnapshot>;

    [[nodiscard]] auto contains(const DeviceId& id) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    // ==================== Configuration ====================

    /**
     * @brief Apply new tunables and clear terminal configuration errors
     */
    void applyConfig(config::RegistryConfig config);

    /**
     * @brief Stop timers, cancel queued work and close push channels
     */
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_REGISTRY_DEVICE_REGISTRY_HPP
