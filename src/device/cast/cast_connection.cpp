/*
 * cast_connection.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: TLS channel to a Cast receiver with heartbeat and request
matching

**************************************************/

#include "cast_connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include "device/net/io_runner.hpp"

namespace hearth::device::cast {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr int kMissedHeartbeats = 3;

auto errorFrom(std::exception_ptr ep, const std::string& target)
    -> DeviceError {
    try {
        std::rethrow_exception(ep);
    } catch (const boost::system::system_error& e) {
        return error::unreachable(target, e.code().message());
    } catch (const DeviceException& e) {
        return e.error();
    } catch (const std::exception& e) {
        return error::protocolError(target + ": " + e.what());
    }
}

}  // namespace

CastConnection::CastConnection(Endpoint endpoint,
                               std::chrono::seconds heartbeat,
                               Listener listener)
    : endpoint_(std::move(endpoint)),
      heartbeat_(heartbeat),
      listener_(std::move(listener)),
      sslContext_(ssl::context::tlsv12_client),
      stream_(ioc_, sslContext_),
      heartbeatTimer_(ioc_) {
    sslContext_.set_verify_mode(ssl::verify_none);
}

CastConnection::~CastConnection() { close(); }

auto CastConnection::open(const Endpoint& endpoint,
                          std::chrono::milliseconds timeout,
                          std::chrono::seconds heartbeat, Listener listener)
    -> DeviceResult<std::unique_ptr<CastConnection>> {
    using ConnectionPtr = std::unique_ptr<CastConnection>;

    boost::system::error_code ec;
    auto address = asio::ip::make_address(endpoint.host, ec);
    if (ec) {
        return failure<ConnectionPtr>(
            error::invalidArgument("Not an IP address: " + endpoint.host));
    }
    const auto port = endpoint.port != 0 ? endpoint.port : kDefaultPort;

    ConnectionPtr connection(new CastConnection(
        Endpoint{endpoint.host, port}, heartbeat, std::move(listener)));
    auto& stream = connection->stream_;

    auto connected = net::runOn<void>(
        connection->ioc_,
        [](beast::ssl_stream<beast::tcp_stream>& s,
           tcp::endpoint target) -> asio::awaitable<DeviceVoidResult> {
            co_await beast::get_lowest_layer(s).async_connect(
                target, asio::use_awaitable);
            co_await s.async_handshake(ssl::stream_base::client,
                                       asio::use_awaitable);
            co_return success();
        }(stream, tcp::endpoint(address, port)),
        timeout, connection->endpoint_.toString(),
        [&stream] { beast::get_lowest_layer(stream).close(); });
    if (!connected) {
        return failure<ConnectionPtr>(error::connectionError(
            connection->endpoint_.toString(), connected.error().message));
    }

    connection->start();
    spdlog::debug("CastConnection: connected to {}",
                  connection->endpoint_.toString());
    return connection;
}

void CastConnection::start() {
    open_ = true;
    lastReceived_ = std::chrono::steady_clock::now();
    ioc_.restart();

    auto onDone = [this](std::exception_ptr ep) {
        if (ep) {
            fail(errorFrom(ep, endpoint_.toString()));
        }
    };
    asio::co_spawn(ioc_, readLoop(), onDone);
    asio::co_spawn(ioc_, heartbeatLoop(), onDone);
    thread_ = std::thread([this] { ioc_.run(); });
}

auto CastConnection::readLoop() -> asio::awaitable<void> {
    for (;;) {
        std::string header(4, '\0');
        co_await asio::async_read(stream_, asio::buffer(header),
                                  asio::use_awaitable);
        auto length = frameLength(header);
        if (!length) {
            throw DeviceException(length.error());
        }
        std::string body(*length, '\0');
        co_await asio::async_read(stream_, asio::buffer(body),
                                  asio::use_awaitable);
        auto message = decodeMessage(body);
        if (!message) {
            throw DeviceException(message.error());
        }
        lastReceived_ = std::chrono::steady_clock::now();
        dispatch(*message);
    }
}

auto CastConnection::writeLoop() -> asio::awaitable<void> {
    while (!outbox_.empty()) {
        co_await asio::async_write(stream_, asio::buffer(outbox_.front()),
                                   asio::use_awaitable);
        outbox_.pop_front();
    }
    writing_ = false;
}

auto CastConnection::heartbeatLoop() -> asio::awaitable<void> {
    for (;;) {
        heartbeatTimer_.expires_after(heartbeat_);
        co_await heartbeatTimer_.async_wait(asio::use_awaitable);
        if (std::chrono::steady_clock::now() - lastReceived_ >
            heartbeat_ * kMissedHeartbeats) {
            throw DeviceException(error::unreachable(
                endpoint_.toString(), "heartbeat timed out"));
        }
        enqueue(encodeFrame(makeMessage(kHeartbeatNamespace, kSenderId,
                                        kReceiverId, {{"type", "PING"}})));
    }
}

void CastConnection::enqueue(std::string frame) {
    if (!open_) {
        return;
    }
    outbox_.push_back(std::move(frame));
    if (!writing_) {
        writing_ = true;
        asio::co_spawn(ioc_, writeLoop(), [this](std::exception_ptr ep) {
            if (ep) {
                fail(errorFrom(ep, endpoint_.toString()));
            }
        });
    }
}

void CastConnection::dispatch(const proto::CastMessage& message) {
    const auto payload = payloadOf(message);
    if (payload.is_null()) {
        spdlog::trace("CastConnection: ignoring non-JSON message on {}",
                      message.namespace_());
        return;
    }
    const auto& ns = message.namespace_();
    const auto type = payload.value("type", "");

    if (ns == kHeartbeatNamespace) {
        if (type == "PING") {
            enqueue(encodeFrame(makeMessage(kHeartbeatNamespace, kSenderId,
                                            message.source_id(),
                                            {{"type", "PONG"}})));
        }
        return;
    }
    if (ns == kConnectionNamespace && type == "CLOSE" &&
        message.source_id() == kReceiverId) {
        fail(error::unreachable(endpoint_.toString(),
                                "receiver closed the channel"));
        return;
    }

    const auto requestId = payload.value("requestId", std::int64_t{0});
    if (requestId != 0) {
        std::shared_ptr<Reply> reply;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            if (auto it = pending_.find(requestId); it != pending_.end()) {
                reply = std::move(it->second);
                pending_.erase(it);
            }
        }
        if (reply) {
            reply->set_value(payload);
        }
    }

    if (listener_.onMessage) {
        try {
            listener_.onMessage(ns, payload);
        } catch (const std::exception& e) {
            spdlog::warn("CastConnection: listener failed on {}: {}", ns,
                         e.what());
        }
    }
}

void CastConnection::fail(const DeviceError& error) {
    if (!open_.exchange(false)) {
        return;
    }
    boost::system::error_code ignored;
    beast::get_lowest_layer(stream_).socket().close(ignored);
    heartbeatTimer_.cancel();
    failPending(error);

    if (!closing_ && listener_.onClosed) {
        spdlog::warn("CastConnection: {} lost: {}", endpoint_.toString(),
                     error.message);
        listener_.onClosed(error);
    }
}

void CastConnection::failPending(const DeviceError& error) {
    std::map<std::int64_t, std::shared_ptr<Reply>> pending;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending.swap(pending_);
    }
    for (auto& [id, reply] : pending) {
        reply->set_value(failure<json>(error));
    }
}

void CastConnection::send(std::string_view ns, std::string_view destination,
                          const json& payload) {
    if (!open_) {
        spdlog::debug("CastConnection: dropping message to closed {}",
                      endpoint_.toString());
        return;
    }
    auto frame =
        encodeFrame(makeMessage(ns, kSenderId, destination, payload));
    asio::post(ioc_, [this, frame = std::move(frame)]() mutable {
        enqueue(std::move(frame));
    });
}

auto CastConnection::request(std::string_view ns, std::string_view destination,
                             json payload, std::chrono::milliseconds timeout)
    -> DeviceResult<json> {
    if (!open_) {
        return failure<json>(error::unreachable(endpoint_.toString(),
                                                "connection closed"));
    }
    const auto requestId = nextRequestId_++;
    payload["requestId"] = requestId;

    auto reply = std::make_shared<Reply>();
    auto future = reply->get_future();
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.emplace(requestId, reply);
    }
    send(ns, destination, payload);

    if (future.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.erase(requestId);
        return failure<json>(
            error::timeout(payload.value("type", "request")));
    }
    return future.get();
}

void CastConnection::close() {
    if (closing_.exchange(true)) {
        return;
    }
    if (!thread_.joinable()) {
        open_ = false;
        return;
    }
    asio::post(ioc_, [this] {
        fail(error::cancelled("connection closed"));
        ioc_.stop();
    });
    if (thread_.get_id() == std::this_thread::get_id()) {
        spdlog::error("CastConnection: close() called from its own thread");
        thread_.detach();
        return;
    }
    thread_.join();
    // Let aborted operations unwind before the stream is destroyed
    ioc_.restart();
    ioc_.poll();
    failPending(error::cancelled("connection closed"));
    spdlog::debug("CastConnection: closed {}", endpoint_.toString());
}

}  // namespace hearth::device::cast
