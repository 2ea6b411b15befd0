/*
 * adapter_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Protocol to adapter lookup

**************************************************/

#include "adapter_registry.hpp"

#include <spdlog/spdlog.h>

namespace hearth::device {

void AdapterRegistry::registerAdapter(std::shared_ptr<DeviceAdapter> adapter) {
    if (!adapter) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto protocol = adapter->protocol();
    adapters_[protocol] = std::move(adapter);
    spdlog::debug("AdapterRegistry: registered {} adapter",
                  protocolToString(protocol));
}

auto AdapterRegistry::get(Protocol protocol) const
    -> std::shared_ptr<DeviceAdapter> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(protocol);
    if (it != adapters_.end()) {
        return it->second;
    }
    return nullptr;
}

auto AdapterRegistry::all() const
    -> std::vector<std::shared_ptr<DeviceAdapter>> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DeviceAdapter>> result;
    result.reserve(adapters_.size());
    for (const auto& [protocol, adapter] : adapters_) {
        result.push_back(adapter);
    }
    return result;
}

void AdapterRegistry::resetAll() {
    for (const auto& adapter : all()) {
        adapter->reset();
    }
}

}  // namespace hearth::device
