/*
 * tcp_stream.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Blocking TCP stream with per-operation deadlines

**************************************************/

#include "tcp_stream.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include "io_runner.hpp"

namespace hearth::device::net {

namespace asio = boost::asio;
using asio::ip::tcp;

TcpStream::TcpStream(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout), socket_(ioc_) {}

TcpStream::~TcpStream() { close(); }

auto TcpStream::connect(const Endpoint& endpoint,
                        std::chrono::milliseconds timeout)
    -> DeviceResult<std::unique_ptr<TcpStream>> {
    using StreamPtr = std::unique_ptr<TcpStream>;

    boost::system::error_code ec;
    auto address = asio::ip::make_address(endpoint.host, ec);
    if (ec) {
        return failure<StreamPtr>(
            error::invalidArgument("Not an IP address: " + endpoint.host));
    }

    StreamPtr stream(new TcpStream(endpoint, timeout));
    auto& socket = stream->socket_;
    auto target = tcp::endpoint(address, endpoint.port);

    auto connected = runOn<void>(
        stream->ioc_,
        [](tcp::socket& s, tcp::endpoint ep) -> asio::awaitable<DeviceVoidResult> {
            co_await s.async_connect(ep, asio::use_awaitable);
            co_return success();
        }(socket, target),
        timeout, endpoint.toString(), [&socket] {
            boost::system::error_code ignored;
            socket.close(ignored);
        });
    if (!connected) {
        return failure<StreamPtr>(
            error::connectionError(endpoint.toString(), connected.error().message));
    }
    spdlog::debug("TcpStream: connected to {}", endpoint.toString());
    return stream;
}

auto TcpStream::write(std::string_view bytes) -> DeviceVoidResult {
    if (!socket_.is_open()) {
        return failure(error::unreachable(endpoint_.toString(), "stream closed"));
    }
    return runOn<void>(
        ioc_,
        [](tcp::socket& s, std::string data) -> asio::awaitable<DeviceVoidResult> {
            co_await asio::async_write(s, asio::buffer(data),
                                       asio::use_awaitable);
            co_return success();
        }(socket_, std::string(bytes)),
        timeout_, endpoint_.toString(), [this] { close(); });
}

auto TcpStream::readExactly(std::size_t count) -> DeviceResult<std::string> {
    if (!socket_.is_open()) {
        return failure<std::string>(
            error::unreachable(endpoint_.toString(), "stream closed"));
    }
    return runOn<std::string>(
        ioc_,
        [](tcp::socket& s, std::size_t n) -> asio::awaitable<DeviceResult<std::string>> {
            std::string data(n, '\0');
            co_await asio::async_read(s, asio::buffer(data),
                                      asio::use_awaitable);
            co_return data;
        }(socket_, count),
        timeout_, endpoint_.toString(), [this] { close(); });
}

void TcpStream::close() {
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::trace("TcpStream: closed {}", endpoint_.toString());
    }
}

}  // namespace hearth::device::net
