/*
 * mdns.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: mDNS / DNS-SD query encoding and response parsing

**************************************************/

#include "mdns.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "device/common/device_exceptions.hpp"

namespace hearth::device::net::mdns {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kUnicastResponse = 0x8000;
constexpr std::uint16_t kClassMask = 0x7fff;
constexpr int kMaxPointerHops = 32;

auto lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

void appendU16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value >> 8));
    out.push_back(static_cast<char>(value & 0xff));
}

class Reader {
public:
    explicit Reader(std::string_view packet) : packet_(packet) {}

    auto u8(std::size_t at) const -> std::uint8_t {
        require(at, 1);
        return static_cast<std::uint8_t>(packet_[at]);
    }

    auto u16(std::size_t at) const -> std::uint16_t {
        require(at, 2);
        return static_cast<std::uint16_t>((u8(at) << 8) | u8(at + 1));
    }

    auto u32(std::size_t at) const -> std::uint32_t {
        return (static_cast<std::uint32_t>(u16(at)) << 16) | u16(at + 2);
    }

    /**
     * @brief Decode a possibly compressed name starting at offset
     * @return Name and the offset just past it in the original position
     */
    auto name(std::size_t offset) const -> std::pair<std::string, std::size_t> {
        std::string result;
        std::size_t pos = offset;
        std::size_t end = 0;
        int hops = 0;
        for (;;) {
            auto len = u8(pos);
            if (len == 0) {
                if (end == 0) {
                    end = pos + 1;
                }
                break;
            }
            if ((len & 0xc0) == 0xc0) {
                if (++hops > kMaxPointerHops) {
                    throw ProtocolException("mDNS name pointer loop");
                }
                if (end == 0) {
                    end = pos + 2;
                }
                pos = u16(pos) & 0x3fff;
                continue;
            }
            require(pos + 1, len);
            if (!result.empty()) {
                result.push_back('.');
            }
            result.append(packet_.substr(pos + 1, len));
            pos += 1 + len;
        }
        return {result, end};
    }

    auto slice(std::size_t at, std::size_t len) const -> std::string_view {
        require(at, len);
        return packet_.substr(at, len);
    }

private:
    void require(std::size_t at, std::size_t len) const {
        if (at + len > packet_.size()) {
            throw ProtocolException(fmt::format(
                "mDNS packet truncated at offset {} (size {})", at,
                packet_.size()));
        }
    }

    std::string_view packet_;
};

auto parseTxt(std::string_view data) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> entries;
    std::size_t pos = 0;
    while (pos < data.size()) {
        auto len = static_cast<std::uint8_t>(data[pos]);
        ++pos;
        if (pos + len > data.size()) {
            break;
        }
        auto entry = data.substr(pos, len);
        pos += len;
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            entries[std::string(entry)] = "";
        } else {
            entries[std::string(entry.substr(0, eq))] =
                std::string(entry.substr(eq + 1));
        }
    }
    return entries;
}

}  // namespace

auto buildPtrQuery(std::string_view serviceType) -> std::string {
    std::string packet;
    appendU16(packet, 0);  // id
    appendU16(packet, 0);  // flags
    appendU16(packet, 1);  // questions
    appendU16(packet, 0);
    appendU16(packet, 0);
    appendU16(packet, 0);

    std::size_t start = 0;
    while (start < serviceType.size()) {
        auto dot = serviceType.find('.', start);
        if (dot == std::string_view::npos) {
            dot = serviceType.size();
        }
        auto label = serviceType.substr(start, dot - start);
        if (!label.empty()) {
            packet.push_back(static_cast<char>(label.size()));
            packet.append(label);
        }
        start = dot + 1;
    }
    packet.push_back('\0');

    appendU16(packet, static_cast<std::uint16_t>(RecordType::PTR));
    appendU16(packet, kClassIn | kUnicastResponse);
    return packet;
}

auto parseMessage(std::string_view packet) -> std::vector<Record> {
    Reader reader(packet);
    if (packet.size() < kHeaderSize) {
        throw ProtocolException("mDNS packet shorter than header");
    }
    auto questions = reader.u16(4);
    auto total = reader.u16(6) + reader.u16(8) + reader.u16(10);

    std::size_t pos = kHeaderSize;
    for (int i = 0; i < questions; ++i) {
        pos = reader.name(pos).second + 4;
    }

    std::vector<Record> records;
    for (int i = 0; i < total; ++i) {
        auto [name, next] = reader.name(pos);
        pos = next;
        Record record;
        record.name = name;
        auto type = reader.u16(pos);
        auto cls = reader.u16(pos + 2) & kClassMask;
        record.ttl = reader.u32(pos + 4);
        auto rdlength = reader.u16(pos + 8);
        auto rdata = pos + 10;
        reader.slice(rdata, rdlength);
        pos = rdata + rdlength;

        if (cls != kClassIn) {
            continue;
        }
        switch (static_cast<RecordType>(type)) {
            case RecordType::PTR:
                record.type = RecordType::PTR;
                record.target = reader.name(rdata).first;
                break;
            case RecordType::SRV:
                record.type = RecordType::SRV;
                record.port = reader.u16(rdata + 4);
                record.target = reader.name(rdata + 6).first;
                break;
            case RecordType::TXT:
                record.type = RecordType::TXT;
                record.txt = parseTxt(reader.slice(rdata, rdlength));
                break;
            case RecordType::A:
                if (rdlength != 4) {
                    continue;
                }
                record.type = RecordType::A;
                record.address =
                    fmt::format("{}.{}.{}.{}", reader.u8(rdata),
                                reader.u8(rdata + 1), reader.u8(rdata + 2),
                                reader.u8(rdata + 3));
                break;
            default:
                continue;
        }
        records.push_back(std::move(record));
    }
    return records;
}

auto collectServices(const std::vector<Record>& records,
                     std::string_view serviceType)
    -> std::vector<ServiceInstance> {
    auto wanted = lower(std::string(serviceType));
    std::vector<ServiceInstance> services;

    for (const auto& ptr : records) {
        if (ptr.type != RecordType::PTR || lower(ptr.name) != wanted) {
            continue;
        }
        ServiceInstance service;
        service.instanceName = ptr.target;
        service.ttl = ptr.ttl;
        auto instance = lower(ptr.target);

        for (const auto& r : records) {
            if (lower(r.name) != instance) {
                continue;
            }
            if (r.type == RecordType::SRV) {
                service.host = r.target;
                service.port = r.port;
            } else if (r.type == RecordType::TXT) {
                service.txt = r.txt;
            }
        }
        if (!service.host.empty()) {
            auto host = lower(service.host);
            for (const auto& r : records) {
                if (r.type == RecordType::A && lower(r.name) == host) {
                    service.address = r.address;
                    break;
                }
            }
        }
        services.push_back(std::move(service));
    }
    return services;
}

}  // namespace hearth::device::net::mdns
