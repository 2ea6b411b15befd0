/*
 * test_cast.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for Cast channel framing, status parsing and mDNS

**************************************************/

#include <gtest/gtest.h>

#include "device/cast/cast_protocol.hpp"
#include "device/common/device_exceptions.hpp"
#include "device/net/mdns.hpp"

using namespace hearth::device;
namespace mdns = hearth::device::net::mdns;

// ========== Framing ==========

TEST(CastFrameTest, EncodeDecode) {
    auto message = cast::makeMessage(cast::kReceiverNamespace, cast::kSenderId,
                                     cast::kReceiverId,
                                     json{{"type", "GET_STATUS"}, {"requestId", 7}});
    auto frame = cast::encodeFrame(message);

    auto length = cast::frameLength(frame.substr(0, 4));
    ASSERT_TRUE(length);
    EXPECT_EQ(*length, frame.size() - 4);

    auto decoded = cast::decodeMessage(frame.substr(4));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->namespace_(), cast::kReceiverNamespace);
    EXPECT_EQ(decoded->destination_id(), cast::kReceiverId);
    auto payload = cast::payloadOf(*decoded);
    EXPECT_EQ(payload["type"], "GET_STATUS");
    EXPECT_EQ(payload["requestId"], 7);
}

TEST(CastFrameTest, FrameLength_Bounds) {
    EXPECT_FALSE(cast::frameLength(std::string(4, '\0')));
    EXPECT_FALSE(cast::frameLength(std::string("\x00\x01\x00\x01", 4)));
    EXPECT_FALSE(cast::frameLength("\x01"));
    EXPECT_TRUE(cast::frameLength(std::string("\x00\x00\x10\x00", 4)));
}

TEST(CastFrameTest, DecodeMessage_RejectsIncomplete) {
    auto decoded = cast::decodeMessage("");
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, DeviceErrorCode::ProtocolError);
}

TEST(CastFrameTest, PayloadOf_BinaryIsNull) {
    auto message = cast::makeMessage(cast::kHeartbeatNamespace, cast::kSenderId,
                                     cast::kReceiverId, json{{"type", "PING"}});
    message.set_payload_type(cast::proto::CastMessage::BINARY);
    EXPECT_TRUE(cast::payloadOf(message).is_null());

    message.set_payload_type(cast::proto::CastMessage::STRING);
    message.set_payload_utf8("not json");
    EXPECT_TRUE(cast::payloadOf(message).is_null());
}

// ========== Receiver and media status ==========

namespace {

auto receiverStatus(bool idle) -> json {
    json app{{"appId", idle ? "E8C28D3C" : "CC32E753"},
             {"displayName", idle ? "Backdrop" : "Spotify"},
             {"sessionId", "session-1"},
             {"transportId", "transport-1"},
             {"isIdleScreen", idle},
             {"namespaces",
              json::array({{{"name", cast::kMediaNamespace}},
                           {{"name", "urn:x-cast:com.spotify.chromecast.secure.v1"}}})}};
    return {{"type", "RECEIVER_STATUS"},
            {"requestId", 1},
            {"status",
             {{"applications", json::array({app})},
              {"volume", {{"level", 0.42}, {"muted", false}}}}}};
}

}  // namespace

TEST(CastStatusTest, ReceiverStatus_ActiveApp) {
    auto status = cast::parseReceiverStatus(receiverStatus(false));
    ASSERT_TRUE(status);
    EXPECT_DOUBLE_EQ(status->volumeLevel, 0.42);
    const auto* app = status->activeApplication();
    ASSERT_NE(app, nullptr);
    EXPECT_EQ(app->displayName, "Spotify");
    EXPECT_EQ(app->transportId, "transport-1");
    EXPECT_TRUE(app->supportsMedia);
}

TEST(CastStatusTest, ReceiverStatus_IdleScreenIsNotActive) {
    auto status = cast::parseReceiverStatus(receiverStatus(true));
    ASSERT_TRUE(status);
    ASSERT_TRUE(status->application);
    EXPECT_EQ(status->activeApplication(), nullptr);

    auto state = cast::stateFromStatus(*status, std::nullopt);
    EXPECT_FALSE(state.power);
    EXPECT_EQ(state.volume, 42);
    ASSERT_TRUE(state.mediaInfo);
    EXPECT_EQ(state.mediaInfo->playbackState, PlaybackState::Idle);
    EXPECT_FALSE(state.mediaInfo->appName);
}

TEST(CastStatusTest, ReceiverStatus_ClampsVolumeAndRejectsOtherTypes) {
    auto loud = receiverStatus(false);
    loud["status"]["volume"]["level"] = 1.7;
    EXPECT_DOUBLE_EQ(cast::parseReceiverStatus(loud)->volumeLevel, 1.0);

    auto wrong = cast::parseReceiverStatus(json{{"type", "MEDIA_STATUS"}});
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, DeviceErrorCode::ProtocolError);
}

TEST(CastStatusTest, MediaStatus) {
    json payload{
        {"type", "MEDIA_STATUS"},
        {"status",
         json::array({{{"mediaSessionId", 3},
                       {"playerState", "PLAYING"},
                       {"currentTime", 12.5},
                       {"media",
                        {{"duration", 200.0},
                         {"metadata",
                          {{"title", "Song"}, {"albumArtist", "Band"}}}}}}})}};
    auto media = cast::parseMediaStatus(payload);
    ASSERT_TRUE(media);
    EXPECT_EQ(media->mediaSessionId, 3);
    EXPECT_EQ(media->playbackState, PlaybackState::Playing);
    EXPECT_EQ(media->title, "Song");
    EXPECT_EQ(media->artist, "Band");
    EXPECT_EQ(media->duration, 200.0);
    EXPECT_EQ(media->position, 12.5);

    auto receiver = cast::parseReceiverStatus(receiverStatus(false));
    auto state = cast::stateFromStatus(*receiver, media);
    EXPECT_TRUE(state.power);
    EXPECT_EQ(state.mediaInfo->playbackState, PlaybackState::Playing);
    EXPECT_EQ(state.mediaInfo->appName, "Spotify");
    EXPECT_EQ(state.mediaInfo->title, "Song");
}

TEST(CastStatusTest, MediaStatus_EmptyOrForeign) {
    EXPECT_FALSE(cast::parseMediaStatus(
        json{{"type", "MEDIA_STATUS"}, {"status", json::array()}}));
    EXPECT_FALSE(cast::parseMediaStatus(json{{"type", "RECEIVER_STATUS"}}));
    EXPECT_EQ(cast::playbackStateFromString("LOADING"), PlaybackState::Unknown);
}

// ========== mDNS ==========

namespace {

/**
 * @brief Assembles DNS response packets record by record
 */
class PacketBuilder {
public:
    PacketBuilder(std::uint16_t questions, std::uint16_t answers) {
        u16(0);
        u16(0x8400);
        u16(questions);
        u16(answers);
        u16(0);
        u16(0);
    }

    void name(std::string_view dotted) { bytes_ += encodeName(dotted); }

    void question(std::string_view dotted, mdns::RecordType type) {
        name(dotted);
        u16(static_cast<std::uint16_t>(type));
        u16(1);
    }

    // Owner name must already have been appended
    void record(mdns::RecordType type, std::uint32_t ttl,
                const std::string& rdata) {
        u16(static_cast<std::uint16_t>(type));
        u16(0x8001);  // cache-flush + IN
        u16(static_cast<std::uint16_t>(ttl >> 16));
        u16(static_cast<std::uint16_t>(ttl & 0xffff));
        u16(static_cast<std::uint16_t>(rdata.size()));
        bytes_ += rdata;
    }

    static auto encodeName(std::string_view dotted) -> std::string {
        std::string out;
        std::size_t start = 0;
        while (start < dotted.size()) {
            auto dot = dotted.find('.', start);
            if (dot == std::string_view::npos) {
                dot = dotted.size();
            }
            out.push_back(static_cast<char>(dot - start));
            out.append(dotted.substr(start, dot - start));
            start = dot + 1;
        }
        out.push_back('\0');
        return out;
    }

    static auto pointer(std::uint16_t offset) -> std::string {
        return {static_cast<char>(0xc0 | (offset >> 8)),
                static_cast<char>(offset & 0xff)};
    }

    void raw(const std::string& bytes) { bytes_ += bytes; }

    [[nodiscard]] auto bytes() const -> const std::string& { return bytes_; }

private:
    void u16(std::uint16_t v) {
        bytes_.push_back(static_cast<char>(v >> 8));
        bytes_.push_back(static_cast<char>(v & 0xff));
    }

    std::string bytes_;
};

auto txt(std::initializer_list<std::string> entries) -> std::string {
    std::string out;
    for (const auto& entry : entries) {
        out.push_back(static_cast<char>(entry.size()));
        out += entry;
    }
    return out;
}

auto castAnswer(std::uint32_t ttl) -> std::string {
    const std::string instance = "Chromecast-abc._googlecast._tcp.local";
    PacketBuilder packet(1, 4);
    packet.question("_googlecast._tcp.local", mdns::RecordType::PTR);

    // PTR owner compressed to the question name at offset 12
    packet.raw(PacketBuilder::pointer(12));
    packet.record(mdns::RecordType::PTR, ttl, PacketBuilder::encodeName(instance));

    packet.name(instance);
    std::string srv("\x00\x00\x00\x00\x1f\x49", 6);  // priority, weight, 8009
    srv += PacketBuilder::encodeName("abc.local");
    packet.record(mdns::RecordType::SRV, 120, srv);

    packet.name(instance);
    packet.record(mdns::RecordType::TXT, 4500,
                  txt({"id=3F2C9A1B0D4E4F5A", "md=Google Home Mini",
                       "fn=Kitchen speaker", "flag"}));

    packet.name("ABC.local");
    packet.record(mdns::RecordType::A, 120, std::string("\xc0\xa8\x01\x2a", 4));
    return packet.bytes();
}

}  // namespace

TEST(MdnsTest, BuildPtrQuery) {
    auto query = mdns::buildPtrQuery("_googlecast._tcp.local");
    ASSERT_EQ(query.size(), 12 + 24 + 4U);
    EXPECT_EQ(query[5], 1);  // one question
    EXPECT_EQ(query.substr(12, 24),
              PacketBuilder::encodeName("_googlecast._tcp.local"));
    // PTR, unicast-response bit set on class IN
    EXPECT_EQ(query.substr(36), std::string("\x00\x0c\x80\x01", 4));
}

TEST(MdnsTest, ParseMessage_AllRecordTypes) {
    auto records = mdns::parseMessage(castAnswer(120));
    ASSERT_EQ(records.size(), 4U);

    EXPECT_EQ(records[0].type, mdns::RecordType::PTR);
    EXPECT_EQ(records[0].name, "_googlecast._tcp.local");
    EXPECT_EQ(records[0].target, "Chromecast-abc._googlecast._tcp.local");

    EXPECT_EQ(records[1].type, mdns::RecordType::SRV);
    EXPECT_EQ(records[1].port, 8009);
    EXPECT_EQ(records[1].target, "abc.local");

    EXPECT_EQ(records[2].txt.at("md"), "Google Home Mini");
    EXPECT_EQ(records[2].txt.at("flag"), "");

    EXPECT_EQ(records[3].address, "192.168.1.42");
}

TEST(MdnsTest, CollectServices_JoinsRecordsCaseInsensitively) {
    auto services = mdns::collectServices(mdns::parseMessage(castAnswer(120)),
                                          "_GoogleCast._tcp.local");
    ASSERT_EQ(services.size(), 1U);
    const auto& service = services[0];
    EXPECT_EQ(service.host, "abc.local");
    EXPECT_EQ(service.address, "192.168.1.42");
    EXPECT_EQ(service.port, 8009);
    EXPECT_EQ(service.ttl, 120U);
    EXPECT_EQ(service.txt.at("fn"), "Kitchen speaker");
    EXPECT_EQ(service.txt.at("id"), "3F2C9A1B0D4E4F5A");

    auto goodbye = mdns::collectServices(mdns::parseMessage(castAnswer(0)),
                                         cast::kServiceType);
    ASSERT_EQ(goodbye.size(), 1U);
    EXPECT_EQ(goodbye[0].ttl, 0U);
}

TEST(MdnsTest, ParseMessage_TruncatedThrows) {
    auto packet = castAnswer(120);
    EXPECT_THROW(mdns::parseMessage(packet.substr(0, packet.size() - 3)),
                 ProtocolException);
    EXPECT_THROW(mdns::parseMessage("\x00\x00"), ProtocolException);
}

TEST(MdnsTest, ParseMessage_PointerLoopThrows) {
    PacketBuilder packet(0, 1);
    packet.raw(PacketBuilder::pointer(12));
    packet.record(mdns::RecordType::A, 1, std::string(4, '\0'));
    EXPECT_THROW(mdns::parseMessage(packet.bytes()), ProtocolException);
}
