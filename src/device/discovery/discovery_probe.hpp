/*
 * discovery_probe.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Per-protocol discovery probe interface

**************************************************/

#ifndef HEARTH_DEVICE_DISCOVERY_DISCOVERY_PROBE_HPP
#define HEARTH_DEVICE_DISCOVERY_DISCOVERY_PROBE_HPP

#include <chrono>
#include <functional>

#include "device/common/device_result.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device {

using SightingCallback = std::function<void(const DeviceDescriptor&)>;

/**
 * @brief Finds devices of one protocol on the local network
 *
 * A scan reports every device that answered within the window. Reporting
 * the same device more than once per scan is allowed; the orchestrator
 * collapses duplicates.
 */
class DiscoveryProbe {
public:
    virtual ~DiscoveryProbe() = default;

    [[nodiscard]] virtual auto protocol() const -> Protocol = 0;

    /**
     * @brief Run one discovery pass
     * @param window Listening time for replies
     * @param onSighting Called for each device found, on the calling thread
     * @return DiscoveryError if the pass could not run at all
     */
    virtual auto scan(std::chrono::milliseconds window,
                      const SightingCallback& onSighting)
        -> DeviceVoidResult = 0;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_DISCOVERY_DISCOVERY_PROBE_HPP
