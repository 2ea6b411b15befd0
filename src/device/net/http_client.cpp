/*
 * http_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Minimal blocking HTTP/1.1 POST client on Boost.Beast

**************************************************/

#include "http_client.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

#include "io_runner.hpp"

namespace hearth::device::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using asio::ip::tcp;

namespace {

constexpr int kHttpVersion = 11;

auto exchange(tcp::endpoint target, Endpoint endpoint, HttpRequest request)
    -> asio::awaitable<DeviceResult<HttpResponse>> {
    auto executor = co_await asio::this_coro::executor;
    beast::tcp_stream stream(executor);

    boost::system::error_code ec;
    co_await stream.async_connect(target,
                                  asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return failure<HttpResponse>(
            error::connectionError(endpoint.toString(), ec.message()));
    }

    http::request<http::string_body> req{http::verb::post, request.target,
                                         kHttpVersion};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "hearth");
    req.set(http::field::content_type, request.contentType);
    req.set(http::field::accept, "*/*");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = std::move(request.body);
    req.prepare_payload();

    co_await http::async_write(stream, req, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, asio::use_awaitable);

    HttpResponse response;
    response.status = res.result_int();
    response.body = std::move(res.body());
    for (const auto& field : res) {
        if (field.name() == http::field::set_cookie) {
            if (auto cookie = parseSetCookie(std::string(field.value()))) {
                response.cookies.insert(std::move(*cookie));
            }
        }
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

}  // namespace

auto parseSetCookie(const std::string& header)
    -> std::optional<std::pair<std::string, std::string>> {
    auto first = header.substr(0, header.find(';'));
    auto eq = first.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(first.substr(0, eq), first.substr(eq + 1));
}

auto httpPost(const Endpoint& endpoint, const HttpRequest& request,
              std::chrono::milliseconds timeout) -> DeviceResult<HttpResponse> {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(endpoint.host, ec);
    if (ec) {
        return failure<HttpResponse>(
            error::invalidArgument("Not an IP address: " + endpoint.host));
    }
    spdlog::trace("http: POST {}{} ({} bytes)", endpoint.toString(),
                  request.target, request.body.size());
    return runWithDeadline<HttpResponse>(
        exchange(tcp::endpoint(address, endpoint.port), endpoint, request),
        timeout, endpoint.toString() + request.target);
}

}  // namespace hearth::device::net
