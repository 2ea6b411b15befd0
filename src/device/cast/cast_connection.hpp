/*
 * cast_connection.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: TLS channel to a Cast receiver with heartbeat and request
matching

**************************************************/

#ifndef HEARTH_DEVICE_CAST_CAST_CONNECTION_HPP
#define HEARTH_DEVICE_CAST_CAST_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>

#include "cast_protocol.hpp"

namespace hearth::device::cast {

/**
 * @brief One TLS connection to port 8009
 *
 * After open() returns, a private thread reads messages, answers PINGs and
 * sends its own PING every heartbeat interval. Three silent intervals close
 * the connection with DeviceUnreachable. Listener callbacks run on that
 * thread; they may call send() but must not call close().
 */
class CastConnection {
public:
    struct Listener {
        std::function<void(const std::string& ns, const json& payload)>
            onMessage;
        // Not called after close()
        std::function<void(const DeviceError& error)> onClosed;
    };

    /**
     * @brief Connect, complete the TLS handshake and start the reader
     *
     * Receivers use self-signed certificates, so the peer is not verified.
     */
    static auto open(const Endpoint& endpoint,
                     std::chrono::milliseconds timeout,
                     std::chrono::seconds heartbeat, Listener listener = {})
        -> DeviceResult<std::unique_ptr<CastConnection>>;

    ~CastConnection();

    CastConnection(const CastConnection&) = delete;
    CastConnection& operator=(const CastConnection&) = delete;

    /**
     * @brief Queue a message; never blocks
     */
    void send(std::string_view ns, std::string_view destination,
              const json& payload);

    /**
     * @brief Send with a fresh requestId and wait for the matching reply
     */
    auto request(std::string_view ns, std::string_view destination,
                 json payload, std::chrono::milliseconds timeout)
        -> DeviceResult<json>;

    /**
     * @brief Stop the reader thread and close the socket
     */
    void close();

    [[nodiscard]] auto isOpen() const -> bool { return open_; }

    [[nodiscard]] auto endpoint() const -> const Endpoint& {
        return endpoint_;
    }

private:
    using Reply = std::promise<DeviceResult<json>>;

    CastConnection(Endpoint endpoint, std::chrono::seconds heartbeat,
                   Listener listener);

    auto readLoop() -> boost::asio::awaitable<void>;
    auto writeLoop() -> boost::asio::awaitable<void>;
    auto heartbeatLoop() -> boost::asio::awaitable<void>;

    // Everything below runs on the connection thread
    void start();
    void enqueue(std::string frame);
    void dispatch(const proto::CastMessage& message);
    void fail(const DeviceError& error);
    void failPending(const DeviceError& error);

    Endpoint endpoint_;
    std::chrono::seconds heartbeat_;
    Listener listener_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslContext_;
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;
    boost::asio::steady_timer heartbeatTimer_;
    std::thread thread_;

    std::deque<std::string> outbox_;
    bool writing_ = false;
    std::chrono::steady_clock::time_point lastReceived_;

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    std::mutex pendingMutex_;
    std::map<std::int64_t, std::shared_ptr<Reply>> pending_;
    std::atomic<std::int64_t> nextRequestId_{1};
};

}  // namespace hearth::device::cast

#endif  // HEARTH_DEVICE_CAST_CAST_CONNECTION_HPP
