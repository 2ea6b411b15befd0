/*
 * http_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Minimal blocking HTTP/1.1 POST client on Boost.Beast

**************************************************/

#ifndef HEARTH_DEVICE_NET_HTTP_CLIENT_HPP
#define HEARTH_DEVICE_NET_HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "device/common/device_result.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::net {

struct HttpRequest {
    std::string target;  // path and query, e.g. "/app/request?seq=5"
    std::string body;
    std::string contentType = "application/octet-stream";
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    std::map<std::string, std::string> cookies;

    [[nodiscard]] auto ok() const -> bool { return status == 200; }
};

/**
 * @brief POST a request over a fresh connection
 *
 * Transport failures map to ConnectionError (connect) or DeviceUnreachable
 * (exchange or timeout). Non-200 statuses are returned, not converted.
 */
[[nodiscard]] auto httpPost(const Endpoint& endpoint, const HttpRequest& request,
                            std::chrono::milliseconds timeout)
    -> DeviceResult<HttpResponse>;

/**
 * @brief Parse "name=value; Path=/; ..." Set-Cookie values into a map
 */
[[nodiscard]] auto parseSetCookie(const std::string& header)
    -> std::optional<std::pair<std::string, std::string>>;

}  // namespace hearth::device::net

#endif  // HEARTH_DEVICE_NET_HTTP_CLIENT_HPP
