/*
 * adapter_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Protocol to adapter lookup

**************************************************/

#ifndef HEARTH_DEVICE_ADAPTER_ADAPTER_REGISTRY_HPP
#define HEARTH_DEVICE_ADAPTER_ADAPTER_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "device_adapter.hpp"

namespace hearth::device {

/**
 * @brief Selects the adapter for a device by its protocol tag
 */
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    /**
     * @brief Register an adapter, replacing any adapter of the same protocol
     */
    void registerAdapter(std::shared_ptr<DeviceAdapter> adapter);

    /**
     * @brief Get the adapter for a protocol
     * @return Adapter or nullptr
     */
    [[nodiscard]] auto get(Protocol protocol) const
        -> std::shared_ptr<DeviceAdapter>;

    [[nodiscard]] auto all() const -> std::vector<std::shared_ptr<DeviceAdapter>>;

    /**
     * @brief Reset every adapter's cached credentials and sessions
     */
    void resetAll();

private:
    mutable std::mutex mutex_;
    std::map<Protocol, std::shared_ptr<DeviceAdapter>> adapters_;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_ADAPTER_ADAPTER_REGISTRY_HPP
