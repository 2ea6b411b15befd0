/*
 * tcp_stream.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Blocking TCP stream with per-operation deadlines

**************************************************/

#ifndef HEARTH_DEVICE_NET_TCP_STREAM_HPP
#define HEARTH_DEVICE_NET_TCP_STREAM_HPP

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "device/common/device_result.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::net {

/**
 * @brief Connected TCP socket whose reads and writes time out
 *
 * Not thread-safe; a stream belongs to one session. After a timeout the
 * socket is closed and every further call fails with DeviceUnreachable.
 */
class TcpStream {
public:
    /**
     * @brief Open a connection
     * @return Stream, or ConnectionError when the peer cannot be reached
     */
    static auto connect(const Endpoint& endpoint,
                        std::chrono::milliseconds timeout)
        -> DeviceResult<std::unique_ptr<TcpStream>>;

    ~TcpStream();

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    [[nodiscard]] auto write(std::string_view bytes) -> DeviceVoidResult;

    [[nodiscard]] auto readExactly(std::size_t count)
        -> DeviceResult<std::string>;

    [[nodiscard]] auto isOpen() const -> bool { return socket_.is_open(); }

    void close();

    [[nodiscard]] auto endpoint() const -> const Endpoint& { return endpoint_; }

private:
    TcpStream(Endpoint endpoint, std::chrono::milliseconds timeout);

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::socket socket_;
};

}  // namespace hearth::device::net

#endif  // HEARTH_DEVICE_NET_TCP_STREAM_HPP
