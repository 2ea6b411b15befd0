/*
 * tuya_protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tuya local protocol 3.3 framing, encryption and data points

**************************************************/

#include "tuya_protocol.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <memory>

#include <fmt/format.h>
#include <openssl/evp.h>

#include "device/adapter/color.hpp"

namespace hearth::device::tuya {

namespace {

constexpr std::size_t kMaxFrameLength = 64 * 1024;
constexpr std::size_t kBlockSize = 16;

auto makeCrcTable() -> std::array<std::uint32_t, 256> {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1U) != 0 ? 0xEDB88320U ^ (c >> 1) : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

void appendU32(std::string& out, std::uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

auto readU32(std::string_view bytes, std::size_t offset) -> std::uint32_t {
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data()) + offset;
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

auto runEcb(std::string_view input, std::string_view key, bool encrypting)
    -> DeviceResult<std::string> {
    if (key.size() != kBlockSize) {
        return failure<std::string>(error::configurationError(
            fmt::format("local key must be 16 characters, got {}",
                        key.size())));
    }
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return failure<std::string>(
            error::internalError("EVP_CIPHER_CTX_new failed"));
    }
    const auto* keyBytes = reinterpret_cast<const unsigned char*>(key.data());
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, keyBytes,
                          nullptr, encrypting ? 1 : 0) != 1) {
        return failure<std::string>(
            error::internalError("AES-128-ECB init failed"));
    }

    std::string out(input.size() + kBlockSize, '\0');
    int written = 0;
    int finalWritten = 0;
    auto* outBytes = reinterpret_cast<unsigned char*>(out.data());
    if (EVP_CipherUpdate(ctx.get(), outBytes, &written,
                         reinterpret_cast<const unsigned char*>(input.data()),
                         static_cast<int>(input.size())) != 1 ||
        EVP_CipherFinal_ex(ctx.get(), outBytes + written, &finalWritten) !=
            1) {
        return failure<std::string>(error::protocolError(
            encrypting ? "AES encryption failed"
                       : "AES decryption failed (wrong local key?)"));
    }
    out.resize(static_cast<std::size_t>(written + finalWritten));
    return out;
}

auto parseJson(std::string_view text) -> DeviceResult<json> {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return failure<json>(error::protocolError(
            fmt::format("invalid JSON from device: {}",
                        text.substr(0, std::min<std::size_t>(text.size(), 64)))));
    }
    return parsed;
}

auto readBool(const json& dps, std::string_view key) -> std::optional<bool> {
    auto it = dps.find(std::string(key));
    if (it != dps.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return std::nullopt;
}

}  // namespace

auto crc32(std::string_view data) -> std::uint32_t {
    static const auto table = makeCrcTable();
    std::uint32_t crc = 0xFFFFFFFFU;
    for (unsigned char byte : data) {
        crc = table[(crc ^ byte) & 0xFFU] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFU;
}

auto encodeFrame(std::uint32_t sequence, CommandType command,
                 std::string_view payload) -> std::string {
    std::string frame;
    frame.reserve(kHeaderSize + payload.size() + kTrailerSize);
    appendU32(frame, kPrefix);
    appendU32(frame, sequence);
    appendU32(frame, static_cast<std::uint32_t>(command));
    appendU32(frame, static_cast<std::uint32_t>(payload.size() + kTrailerSize));
    frame.append(payload);
    appendU32(frame, crc32(frame));
    appendU32(frame, kSuffix);
    return frame;
}

auto remainingLength(std::string_view header) -> DeviceResult<std::size_t> {
    if (header.size() < kHeaderSize) {
        return failure<std::size_t>(error::protocolError("short Tuya header"));
    }
    if (readU32(header, 0) != kPrefix) {
        return failure<std::size_t>(error::protocolError("bad Tuya prefix"));
    }
    const std::size_t length = readU32(header, 12);
    if (length < kTrailerSize || length > kMaxFrameLength) {
        return failure<std::size_t>(error::protocolError(
            fmt::format("bad Tuya frame length {}", length)));
    }
    return length;
}

auto decodeFrame(std::string_view bytes, bool hasReturnCode)
    -> DeviceResult<Frame> {
    auto length = remainingLength(bytes);
    if (!length) {
        return failure<Frame>(length.error());
    }
    const std::size_t total = kHeaderSize + *length;
    if (bytes.size() < total) {
        return failure<Frame>(error::protocolError("truncated Tuya frame"));
    }
    bytes = bytes.substr(0, total);
    if (readU32(bytes, total - 4) != kSuffix) {
        return failure<Frame>(error::protocolError("bad Tuya suffix"));
    }
    const auto expected = readU32(bytes, total - kTrailerSize);
    const auto actual = crc32(bytes.substr(0, total - kTrailerSize));
    if (expected != actual) {
        return failure<Frame>(error::protocolError(fmt::format(
            "Tuya CRC mismatch: {:08x} != {:08x}", expected, actual)));
    }

    Frame frame;
    frame.sequence = readU32(bytes, 4);
    frame.command = readU32(bytes, 8);
    auto payload = bytes.substr(kHeaderSize, *length - kTrailerSize);
    if (hasReturnCode && payload.size() >= 4) {
        frame.returnCode = readU32(payload, 0);
        payload.remove_prefix(4);
    }
    frame.payload = std::string(payload);
    return frame;
}

auto encrypt(std::string_view plain, std::string_view key)
    -> DeviceResult<std::string> {
    return runEcb(plain, key, true);
}

auto decrypt(std::string_view cipher, std::string_view key)
    -> DeviceResult<std::string> {
    if (cipher.size() % kBlockSize != 0) {
        return failure<std::string>(error::protocolError(
            fmt::format("ciphertext length {} is not a multiple of 16",
                        cipher.size())));
    }
    return runEcb(cipher, key, false);
}

auto broadcastKey() -> std::string {
    static const std::string key = [] {
        constexpr std::string_view seed = "yGAdlopoPVldABfn";
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int size = 0;
        if (EVP_Digest(seed.data(), seed.size(), digest.data(), &size,
                       EVP_md5(), nullptr) != 1) {
            size = 0;
        }
        return std::string(reinterpret_cast<const char*>(digest.data()), size);
    }();
    return key;
}

auto buildDpQuery(const std::string& deviceId, std::int64_t timestamp)
    -> json {
    return {{"gwId", deviceId},
            {"devId", deviceId},
            {"uid", deviceId},
            {"t", std::to_string(timestamp)}};
}

auto buildControl(const std::string& deviceId, json dps,
                  std::int64_t timestamp) -> json {
    return {{"devId", deviceId},
            {"uid", deviceId},
            {"t", std::to_string(timestamp)},
            {"dps", std::move(dps)}};
}

auto encodeRequest(std::uint32_t sequence, CommandType command,
                   const json& body, std::string_view key)
    -> DeviceResult<std::string> {
    auto cipher = encrypt(body.dump(), key);
    if (!cipher) {
        return failure<std::string>(cipher.error());
    }
    std::string payload;
    if (command == CommandType::Control) {
        payload.append(kVersion);
        payload.append(kVersionHeaderSize - kVersion.size(), '\0');
    }
    payload.append(*cipher);
    return encodeFrame(sequence, command, payload);
}

auto decodePayload(std::string_view payload, std::string_view key)
    -> DeviceResult<json> {
    if (payload.empty()) {
        return json(nullptr);
    }
    if (payload.starts_with(kVersion) &&
        payload.size() >= kVersionHeaderSize) {
        payload.remove_prefix(kVersionHeaderSize);
    }
    // Some firmware answers errors in plain text
    if (payload.front() == '{') {
        return parseJson(payload);
    }
    auto plain = decrypt(payload, key);
    if (!plain) {
        return failure<json>(plain.error());
    }
    return parseJson(*plain);
}

auto dpsForCommand(const Command& command) -> DeviceResult<json> {
    json dps = json::object();
    if (const auto* power = std::get_if<SetPower>(&command)) {
        dps[std::string(kDpLedSwitch)] = power->on;
    } else if (const auto* brightness = std::get_if<SetBrightness>(&command)) {
        dps[std::string(kDpLedSwitch)] = true;
        dps[std::string(kDpMode)] = "white";
        dps[std::string(kDpBrightness)] = levelToBrightness(brightness->level);
    } else if (const auto* color = std::get_if<SetColor>(&command)) {
        dps[std::string(kDpLedSwitch)] = true;
        dps[std::string(kDpMode)] = "colour";
        dps[std::string(kDpColour)] = encodeColour(color->color);
    } else {
        return failure<json>(error::unsupported(describeCommand(command)));
    }
    return dps;
}

auto stateFromDps(const json& dps) -> DeviceState {
    DeviceState state;
    if (auto on = readBool(dps, kDpLedSwitch)) {
        state.power = *on;
    } else if (auto sw = readBool(dps, kDpSwitch)) {
        state.power = *sw;
    }

    const auto mode = dps.value(std::string(kDpMode), std::string{});
    if (auto it = dps.find(std::string(kDpBrightness));
        it != dps.end() && it->is_number()) {
        state.brightness = brightnessToLevel(it->get<int>());
    }
    if (mode != "white") {
        if (auto it = dps.find(std::string(kDpColour));
            it != dps.end() && it->is_string()) {
            state.color = decodeColour(it->get<std::string>());
        }
    }
    state.reachable = true;
    state.lastUpdated = Clock::now();
    return state;
}

auto encodeColour(const Rgb& color) -> std::string {
    const auto hsv = rgbToHsv(color);
    const auto h = static_cast<int>(std::lround(hsv.h)) % 360;
    const auto s = static_cast<int>(std::lround(hsv.s * 1000.0));
    const auto v = static_cast<int>(std::lround(hsv.v * 1000.0));
    return fmt::format("{:04x}{:04x}{:04x}", h, s, v);
}

auto decodeColour(std::string_view hex) -> std::optional<Rgb> {
    if (hex.size() != 12) {
        return std::nullopt;
    }
    std::array<int, 3> parts{};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto* first = hex.data() + i * 4;
        auto [ptr, ec] = std::from_chars(first, first + 4, parts[i], 16);
        if (ec != std::errc{} || ptr != first + 4) {
            return std::nullopt;
        }
    }
    return hsvToRgb(Hsv{static_cast<double>(parts[0] % 360),
                        std::clamp(parts[1], 0, 1000) / 1000.0,
                        std::clamp(parts[2], 0, 1000) / 1000.0});
}

auto levelToBrightness(int level) -> int {
    level = std::clamp(level, 0, 100);
    return 10 + (level * 990 + 50) / 100;
}

auto brightnessToLevel(int brightness) -> int {
    brightness = std::clamp(brightness, 10, 1000);
    return ((brightness - 10) * 100 + 495) / 990;
}

auto parseBroadcast(std::string_view datagram, bool encrypted)
    -> DeviceResult<json> {
    auto frame = decodeFrame(datagram, true);
    if (!frame) {
        return failure<json>(frame.error());
    }
    std::string body = frame->payload;
    if (encrypted) {
        auto plain = decrypt(body, broadcastKey());
        if (!plain) {
            return failure<json>(plain.error());
        }
        body = std::move(*plain);
    }
    auto announcement = parseJson(body);
    if (!announcement) {
        return announcement;
    }
    if (!announcement->is_object() || !announcement->contains("gwId") ||
        !announcement->contains("ip")) {
        return failure<json>(
            error::protocolError("Tuya announcement without gwId or ip"));
    }
    return announcement;
}

}  // namespace hearth::device::tuya
