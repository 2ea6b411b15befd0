/*
 * udp_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Blocking UDP request, broadcast and listen helpers with
deadlines

**************************************************/

#include "udp_client.hpp"

#include <array>
#include <optional>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include "io_runner.hpp"

namespace hearth::device::net {

namespace asio = boost::asio;
using asio::ip::udp;

namespace {

constexpr std::size_t kMaxDatagram = 65507;

auto resolveTarget(const Endpoint& target) -> DeviceResult<udp::endpoint> {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(target.host, ec);
    if (ec) {
        return failure<udp::endpoint>(error::invalidArgument(
            "Not an IP address: " + target.host));
    }
    return udp::endpoint(address, target.port);
}

auto requestOnce(udp::endpoint target, std::string payload)
    -> asio::awaitable<DeviceResult<std::string>> {
    auto executor = co_await asio::this_coro::executor;
    udp::socket socket(executor, udp::endpoint(udp::v4(), 0));

    co_await socket.async_send_to(asio::buffer(payload), target,
                                  asio::use_awaitable);

    std::array<char, kMaxDatagram> buffer{};
    for (;;) {
        udp::endpoint sender;
        auto n = co_await socket.async_receive_from(asio::buffer(buffer),
                                                    sender, asio::use_awaitable);
        // Ignore stray datagrams from other hosts
        if (sender.address() == target.address()) {
            co_return std::string(buffer.data(), n);
        }
    }
}

/**
 * @brief Receive loop shared by collect and listen; never completes on its
 * own, the deadline ends it.
 */
auto receiveLoop(udp::socket& socket, const DatagramHandler& handler)
    -> asio::awaitable<void> {
    std::array<char, kMaxDatagram> buffer{};
    for (;;) {
        udp::endpoint sender;
        boost::system::error_code ec;
        auto n = co_await socket.async_receive_from(
            asio::buffer(buffer), sender,
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted) {
            co_return;
        }
        if (ec) {
            // ICMP port unreachable and similar: keep listening
            spdlog::trace("udp: receive error ignored: {}", ec.message());
            continue;
        }
        handler(Datagram{std::string(buffer.data(), n),
                         sender.address().to_string(), sender.port()});
    }
}

/**
 * @brief Run the io_context for a whole window; the handlers are the output
 */
void runWindow(asio::io_context& ioc, std::chrono::milliseconds window) {
    ioc.run_for(window);
    ioc.stop();
}

}  // namespace

auto udpRequest(const Endpoint& target, std::string_view payload,
                std::chrono::milliseconds timeout)
    -> DeviceResult<std::string> {
    auto endpoint = resolveTarget(target);
    if (!endpoint) {
        return failure<std::string>(endpoint.error());
    }
    spdlog::trace("udp: -> {} {}", target.toString(), payload);
    return runWithDeadline<std::string>(
        requestOnce(*endpoint, std::string(payload)), timeout,
        target.toString());
}

auto udpCollect(const Endpoint& target, std::string_view payload,
                const CollectOptions& options, const DatagramHandler& onReply)
    -> DeviceVoidResult {
    auto endpoint = resolveTarget(target);
    if (!endpoint) {
        return failure(endpoint.error());
    }

    asio::io_context ioc;
    udp::socket socket(ioc);
    boost::system::error_code ec;
    socket.open(udp::v4(), ec);
    if (!ec) {
        socket.set_option(udp::socket::reuse_address(true), ec);
    }
    if (!ec && options.broadcast) {
        socket.set_option(asio::socket_base::broadcast(true), ec);
    }
    if (!ec) {
        socket.bind(udp::endpoint(udp::v4(), options.localPort), ec);
    }
    if (!ec && options.multicast) {
        socket.set_option(asio::ip::multicast::join_group(endpoint->address()),
                          ec);
    }
    if (ec) {
        return failure(error::discoveryError("Cannot open UDP socket for " +
                                             target.toString() + ": " +
                                             ec.message()));
    }

    socket.send_to(asio::buffer(payload.data(), payload.size()), *endpoint, 0,
                   ec);
    if (ec) {
        return failure(error::discoveryError("Cannot send to " +
                                             target.toString() + ": " +
                                             ec.message()));
    }

    asio::co_spawn(ioc, receiveLoop(socket, onReply), asio::detached);
    runWindow(ioc, options.window);
    return success();
}

auto udpListen(std::uint16_t port, std::chrono::milliseconds window,
               const DatagramHandler& onDatagram) -> DeviceVoidResult {
    asio::io_context ioc;
    udp::socket socket(ioc);
    boost::system::error_code ec;
    socket.open(udp::v4(), ec);
    if (!ec) {
        socket.set_option(udp::socket::reuse_address(true), ec);
    }
    if (!ec) {
        socket.bind(udp::endpoint(udp::v4(), port), ec);
    }
    if (ec) {
        return failure(error::discoveryError(
            "Cannot listen on UDP port " + std::to_string(port) + ": " +
            ec.message()));
    }

    asio::co_spawn(ioc, receiveLoop(socket, onDatagram), asio::detached);
    runWindow(ioc, window);
    return success();
}

}  // namespace hearth::device::net
