/*
 * udp_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Blocking UDP request, broadcast and listen helpers with
deadlines

**************************************************/

#ifndef HEARTH_DEVICE_NET_UDP_CLIENT_HPP
#define HEARTH_DEVICE_NET_UDP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "device/common/device_result.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::net {

struct Datagram {
    std::string payload;
    std::string senderHost;
    std::uint16_t senderPort = 0;
};

using DatagramHandler = std::function<void(const Datagram&)>;

/**
 * @brief Options for a collection window
 */
struct CollectOptions {
    std::chrono::milliseconds window{2000};
    bool broadcast = false;
    bool multicast = false;
    // Bind to this local port instead of an ephemeral one (mDNS uses 5353)
    std::uint16_t localPort = 0;
};

/**
 * @brief Send one datagram and wait for the first reply from the target
 * @return Reply payload, or DeviceUnreachable after the timeout
 */
[[nodiscard]] auto udpRequest(const Endpoint& target, std::string_view payload,
                              std::chrono::milliseconds timeout)
    -> DeviceResult<std::string>;

/**
 * @brief Send one datagram and report every reply during the window
 *
 * Ending the window is the normal outcome. Fails with DiscoveryError when the
 * socket cannot be opened or the datagram cannot be sent.
 */
[[nodiscard]] auto udpCollect(const Endpoint& target, std::string_view payload,
                              const CollectOptions& options,
                              const DatagramHandler& onReply)
    -> DeviceVoidResult;

/**
 * @brief Bind a local port and report every datagram received in the window
 */
[[nodiscard]] auto udpListen(std::uint16_t port,
                             std::chrono::milliseconds window,
                             const DatagramHandler& onDatagram)
    -> DeviceVoidResult;

}  // namespace hearth::device::net

#endif  // HEARTH_DEVICE_NET_UDP_CLIENT_HPP
