/*
 * cast_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Chromecast speaker adapter and mDNS discovery probe

**************************************************/

#include "cast_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

#include <spdlog/spdlog.h>

#include "cast_connection.hpp"
#include "device/net/mdns.hpp"
#include "device/net/udp_client.hpp"

namespace hearth::device::cast {

namespace {

class CastSession : public DeviceSession {
public:
    CastSession(DeviceDescriptor descriptor,
                std::unique_ptr<CastConnection> connection)
        : DeviceSession(std::move(descriptor)),
          connection_(std::move(connection)) {}

    auto connection() -> CastConnection& { return *connection_; }

private:
    std::unique_ptr<CastConnection> connection_;
};

auto connectMessage() -> json { return {{"type", "CONNECT"}}; }

/**
 * @brief Reject error replies such as INVALID_REQUEST or LOAD_FAILED
 */
auto checkReply(DeviceResult<json> reply) -> DeviceResult<json> {
    if (!reply) {
        return reply;
    }
    const auto type = reply->value("type", "");
    if (type == "INVALID_REQUEST" || type == "LOAD_FAILED" ||
        type == "LAUNCH_ERROR" || type == "INVALID_PLAYER_STATE") {
        return failure<json>(error::protocolError(
            type + ": " + reply->value("reason", std::string{"no reason"})));
    }
    return reply;
}

auto queryReceiver(CastConnection& connection,
                   std::chrono::milliseconds timeout)
    -> DeviceResult<ReceiverStatus> {
    auto reply = checkReply(connection.request(
        kReceiverNamespace, kReceiverId, {{"type", "GET_STATUS"}}, timeout));
    if (!reply) {
        return failure<ReceiverStatus>(reply.error());
    }
    return parseReceiverStatus(*reply);
}

auto queryMedia(CastConnection& connection, const CastApplication& app,
                std::chrono::milliseconds timeout)
    -> DeviceResult<std::optional<MediaStatus>> {
    if (!app.supportsMedia || app.transportId.empty()) {
        return std::optional<MediaStatus>{};
    }
    connection.send(kConnectionNamespace, app.transportId, connectMessage());
    auto reply = checkReply(connection.request(
        kMediaNamespace, app.transportId, {{"type", "GET_STATUS"}}, timeout));
    if (!reply) {
        return failure<std::optional<MediaStatus>>(reply.error());
    }
    return parseMediaStatus(*reply);
}

auto mediaCommandType(MediaAction action) -> const char* {
    switch (action) {
        case MediaAction::Play:
            return "PLAY";
        case MediaAction::Pause:
            return "PAUSE";
        case MediaAction::Stop:
            return "STOP";
    }
    return "STOP";
}

auto lowercase(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

/**
 * @brief Latest statuses seen on a watched connection
 */
struct WatchState {
    std::mutex mutex;
    std::optional<ReceiverStatus> receiver;
    std::optional<MediaStatus> media;
    std::string joinedTransport;
    CastConnection* connection = nullptr;
    std::int64_t nextRequestId = 1;
    PushSink sink;
};

void onWatchedMessage(WatchState& watch, const std::string& ns,
                      const json& payload) {
    std::optional<DeviceState> update;
    std::string joinTransport;
    CastConnection* connection = nullptr;
    std::int64_t requestId = 0;
    {
        std::lock_guard<std::mutex> lock(watch.mutex);
        if (ns == kReceiverNamespace) {
            auto status = parseReceiverStatus(payload);
            if (!status) {
                return;
            }
            watch.receiver = std::move(*status);
            const auto* app = watch.receiver->activeApplication();
            if (app == nullptr) {
                watch.media.reset();
                watch.joinedTransport.clear();
            } else if (app->supportsMedia &&
                       app->transportId != watch.joinedTransport) {
                watch.media.reset();
                watch.joinedTransport = app->transportId;
                joinTransport = app->transportId;
            }
        } else if (ns == kMediaNamespace) {
            if (payload.value("type", "") != "MEDIA_STATUS") {
                return;
            }
            watch.media = parseMediaStatus(payload);
        } else {
            return;
        }
        if (watch.receiver) {
            update = stateFromStatus(*watch.receiver, watch.media);
        }
        connection = watch.connection;
        requestId = watch.nextRequestId++;
    }

    if (!joinTransport.empty() && connection != nullptr) {
        connection->send(kConnectionNamespace, joinTransport,
                         connectMessage());
        connection->send(kMediaNamespace, joinTransport,
                         {{"type", "GET_STATUS"}, {"requestId", requestId}});
    }
    if (update && watch.sink.onState) {
        watch.sink.onState(*update);
    }
}

}  // namespace

// ==================== CastAdapter ====================

CastAdapter::CastAdapter(std::shared_ptr<config::ConfigProvider> config,
                         std::chrono::milliseconds timeout)
    : config_(std::move(config)), timeout_(timeout) {}

auto CastAdapter::heartbeat() const -> std::chrono::seconds {
    return std::chrono::seconds(
        std::max<std::size_t>(config_->current()->cast.heartbeatSeconds, 1));
}

auto CastAdapter::connect(const DeviceDescriptor& descriptor)
    -> DeviceResult<std::unique_ptr<DeviceSession>> {
    using SessionResult = DeviceResult<std::unique_ptr<DeviceSession>>;
    auto connection =
        CastConnection::open(descriptor.address, timeout_, heartbeat());
    if (!connection) {
        return SessionResult(std::unexpect, connection.error());
    }
    (*connection)->send(kConnectionNamespace, kReceiverId, connectMessage());
    return std::make_unique<CastSession>(descriptor, std::move(*connection));
}

auto CastAdapter::applyCommand(DeviceSession& session, const Command& command)
    -> DeviceVoidResult {
    auto& connection = static_cast<CastSession&>(session).connection();
    const auto& id = session.descriptor().id.str();

    if (const auto* power = std::get_if<SetPower>(&command)) {
        if (power->on) {
            spdlog::debug("CastAdapter: {} is always on", id);
            return success();
        }
        auto status = queryReceiver(connection, timeout_);
        if (!status) {
            return failure(status.error());
        }
        const auto* app = status->activeApplication();
        if (app == nullptr) {
            return success();
        }
        spdlog::debug("CastAdapter: {} stopping {}", id, app->displayName);
        auto reply = checkReply(connection.request(
            kReceiverNamespace, kReceiverId,
            {{"type", "STOP"}, {"sessionId", app->sessionId}}, timeout_));
        if (!reply) {
            return failure(reply.error());
        }
        return success();
    }

    if (const auto* volume = std::get_if<SetVolume>(&command)) {
        auto reply = checkReply(connection.request(
            kReceiverNamespace, kReceiverId,
            {{"type", "SET_VOLUME"},
             {"volume", {{"level", volume->level / 100.0}}}},
            timeout_));
        if (!reply) {
            return failure(reply.error());
        }
        return success();
    }

    if (const auto* media = std::get_if<MediaControl>(&command)) {
        auto status = queryReceiver(connection, timeout_);
        if (!status) {
            return failure(status.error());
        }
        const auto* app = status->activeApplication();
        if (app == nullptr) {
            return failure(error::invalidArgument("nothing is playing"));
        }
        auto mediaStatus = queryMedia(connection, *app, timeout_);
        if (!mediaStatus) {
            return failure(mediaStatus.error());
        }
        if (!*mediaStatus || (*mediaStatus)->mediaSessionId == 0) {
            return failure(
                error::invalidArgument("no active media session"));
        }
        auto reply = checkReply(connection.request(
            kMediaNamespace, app->transportId,
            {{"type", mediaCommandType(media->action)},
             {"mediaSessionId", (*mediaStatus)->mediaSessionId}},
            timeout_));
        if (!reply) {
            return failure(reply.error());
        }
        return success();
    }

    return failure(error::unsupported(describeCommand(command)));
}

auto CastAdapter::fetchState(DeviceSession& session)
    -> DeviceResult<DeviceState> {
    auto& connection = static_cast<CastSession&>(session).connection();
    auto status = queryReceiver(connection, timeout_);
    if (!status) {
        return failure<DeviceState>(status.error());
    }
    std::optional<MediaStatus> media;
    if (const auto* app = status->activeApplication()) {
        auto queried = queryMedia(connection, *app, timeout_);
        if (!queried) {
            return failure<DeviceState>(queried.error());
        }
        media = std::move(*queried);
    }
    return stateFromStatus(*status, media);
}

void CastAdapter::close(DeviceSession& session) {
    auto& connection = static_cast<CastSession&>(session).connection();
    connection.send(kConnectionNamespace, kReceiverId, {{"type", "CLOSE"}});
    connection.close();
}

auto CastAdapter::watch(const DeviceDescriptor& descriptor, PushSink sink)
    -> DeviceResult<PushSubscription> {
    auto state = std::make_shared<WatchState>();
    state->sink = std::move(sink);

    CastConnection::Listener listener;
    listener.onMessage = [state](const std::string& ns, const json& payload) {
        onWatchedMessage(*state, ns, payload);
    };
    listener.onClosed = [state](const DeviceError& error) {
        if (state->sink.onClosed) {
            state->sink.onClosed(error);
        }
    };

    auto opened = CastConnection::open(descriptor.address, timeout_,
                                       heartbeat(), std::move(listener));
    if (!opened) {
        return failure<PushSubscription>(opened.error());
    }
    std::shared_ptr<CastConnection> connection = std::move(*opened);
    std::int64_t requestId = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->connection = connection.get();
        requestId = state->nextRequestId++;
    }
    connection->send(kConnectionNamespace, kReceiverId, connectMessage());
    connection->send(kReceiverNamespace, kReceiverId,
                     {{"type", "GET_STATUS"}, {"requestId", requestId}});
    spdlog::info("CastAdapter: watching {}", descriptor.id.str());

    return PushSubscription([connection, state] {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->connection = nullptr;
        }
        connection->close();
    });
}

// ==================== CastProbe ====================

auto CastProbe::scan(std::chrono::milliseconds window,
                     const SightingCallback& onSighting) -> DeviceVoidResult {
    std::map<std::string, DeviceDescriptor> found;

    net::CollectOptions options;
    options.window = window;
    options.multicast = true;
    auto collected = net::udpCollect(
        Endpoint{net::mdns::kMulticastAddress, net::mdns::kPort},
        net::mdns::buildPtrQuery(kServiceType), options,
        [&](const net::Datagram& datagram) {
            std::vector<net::mdns::Record> records;
            try {
                records = net::mdns::parseMessage(datagram.payload);
            } catch (const DeviceException& e) {
                spdlog::trace("CastProbe: bad mDNS packet from {}: {}",
                              datagram.senderHost, e.what());
                return;
            }
            for (auto& instance :
                 net::mdns::collectServices(records, kServiceType)) {
                auto uuid = lowercase(instance.txt["id"]);
                if (uuid.empty() || instance.ttl == 0) {
                    continue;
                }
                auto name = instance.txt["fn"];
                if (name.empty()) {
                    name = instance.instanceName.substr(
                        0, instance.instanceName.find('.'));
                }

                DeviceDescriptor descriptor;
                descriptor.id = DeviceId::make(Protocol::Chromecast, uuid);
                descriptor.displayName = std::move(name);
                descriptor.kind = DeviceKind::Speaker;
                descriptor.protocol = Protocol::Chromecast;
                descriptor.capabilities = {CapabilityTag::Power,
                                           CapabilityTag::Volume,
                                           CapabilityTag::Media};
                descriptor.address = Endpoint{
                    instance.address.empty() ? datagram.senderHost
                                             : instance.address,
                    instance.port != 0 ? instance.port : kDefaultPort};
                descriptor.lastSeen = Clock::now();
                descriptor.model = instance.txt["md"].empty()
                                       ? std::string{"Chromecast"}
                                       : instance.txt["md"];
                descriptor.manufacturer = "Google";
                found[uuid] = std::move(descriptor);
            }
        });
    if (!collected) {
        return failure(error::discoveryError("mDNS query failed: " +
                                             collected.error().message));
    }

    for (const auto& [uuid, descriptor] : found) {
        onSighting(descriptor);
    }
    spdlog::debug("CastProbe: {} receiver(s) answered", found.size());
    return success();
}

}  // namespace hearth::device::cast
