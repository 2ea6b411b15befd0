/*
 * mdns.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: mDNS / DNS-SD query encoding and response parsing

**************************************************/

#ifndef HEARTH_DEVICE_NET_MDNS_HPP
#define HEARTH_DEVICE_NET_MDNS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hearth::device::net::mdns {

inline constexpr const char* kMulticastAddress = "224.0.0.251";
inline constexpr std::uint16_t kPort = 5353;

enum class RecordType : std::uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33
};

struct Record {
    std::string name;
    RecordType type = RecordType::A;
    std::uint32_t ttl = 0;

    // PTR target or SRV target host
    std::string target;
    std::uint16_t port = 0;
    std::string address;  // A records, dotted quad
    std::map<std::string, std::string> txt;
};

/**
 * @brief A DNS-SD service instance assembled from PTR/SRV/TXT/A records
 */
struct ServiceInstance {
    std::string instanceName;  // "Living Room._googlecast._tcp.local"
    std::string host;          // SRV target
    std::string address;       // resolved IPv4, may be empty
    std::uint16_t port = 0;
    std::map<std::string, std::string> txt;
    // TTL of the PTR record; zero is a goodbye announcement
    std::uint32_t ttl = 0;
};

/**
 * @brief Encode a one-question PTR query with the unicast-response bit set
 */
[[nodiscard]] auto buildPtrQuery(std::string_view serviceType)
    -> std::string;

/**
 * @brief Parse all answer, authority and additional records of a message
 *
 * Throws ProtocolException on truncated or malformed packets.
 */
[[nodiscard]] auto parseMessage(std::string_view packet)
    -> std::vector<Record>;

/**
 * @brief Join records into service instances of one service type
 */
[[nodiscard]] auto collectServices(const std::vector<Record>& records,
                                   std::string_view serviceType)
    -> std::vector<ServiceInstance>;

}  // namespace hearth::device::net::mdns

#endif  // HEARTH_DEVICE_NET_MDNS_HPP
