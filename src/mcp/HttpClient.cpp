// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    auto defaultPort(std::string_view scheme) -> std::string_view
    {
        return (scheme == "https" || scheme == "wss") ? "443" : "80";
    }

    auto toVerb(HttpMethod method) -> http::verb
    {
        switch (method)
        {
            case HttpMethod::Get: return http::verb::get;
            case HttpMethod::Post: return http::verb::post;
            case HttpMethod::Delete: return http::verb::delete_;
        }
        return http::verb::post;
    }

    template <typename Stream>
    auto roundTrip(Stream& stream, http::request<http::string_body>& request)
        -> asio::awaitable<http::response<http::string_body>>
    {
        co_await http::async_write(stream, request, asio::use_awaitable);

        auto buffer = beast::flat_buffer {};
        auto response = http::response<http::string_body> {};
        co_await http::async_read(stream, buffer, response, asio::use_awaitable);
        co_return response;
    }
} // namespace

auto tlsClientContext() -> ssl::context&
{
    static auto context = [] {
        auto ctx = ssl::context(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
        return ctx;
    }();
    return context;
}

auto Url::hostHeader() const -> std::string
{
    auto const bracketed = host.find(':') != std::string::npos ? std::format("[{}]", host) : host;
    if (port == defaultPort(scheme))
        return bracketed;
    return std::format("{}:{}", bracketed, port);
}

auto parseUrl(std::string_view url) -> Result<Url>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': missing scheme", url));

    auto result = Url {};
    result.scheme = toLower(url.substr(0, schemeEnd));
    if (result.scheme != "http" && result.scheme != "https" && result.scheme != "ws" && result.scheme != "wss")
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Invalid URL '{}': unsupported scheme '{}'", url, result.scheme));

    auto rest = url.substr(schemeEnd + 3);
    auto const authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    auto target = authorityEnd == std::string_view::npos ? std::string_view {} : rest.substr(authorityEnd);

    if (auto const at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);

    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': bad IPv6 host", url));
        result.host = std::string(authority.substr(1, close - 1));
        auto const tail = authority.substr(close + 1);
        result.port = tail.starts_with(':') ? std::string(tail.substr(1)) : std::string {};
    }
    else if (auto const colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        result.host = std::string(authority.substr(0, colon));
        result.port = std::string(authority.substr(colon + 1));
    }
    else
    {
        result.host = std::string(authority);
    }

    if (result.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': missing host", url));
    if (result.port.empty())
        result.port = std::string(defaultPort(result.scheme));
    if (!std::ranges::all_of(result.port, [](unsigned char c) { return std::isdigit(c); }))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid URL '{}': bad port", url));

    if (auto const hash = target.find('#'); hash != std::string_view::npos)
        target = target.substr(0, hash);
    result.target = target.empty() ? std::string("/") : std::string(target);
    if (result.target.front() == '?')
        result.target.insert(0, "/");

    return result;
}

auto HttpResponse::header(std::string_view name) const -> std::optional<std::string>
{
    if (auto const it = headers.find(toLower(name)); it != headers.end())
        return it->second;
    return std::nullopt;
}

auto describeHttpFailure(const HttpResponse& response) -> std::string
{
    return std::format("HTTP {}: {}. Body: {}", response.status, response.reason, response.body);
}

auto sendHttpRequest(HttpRequest request) -> asio::awaitable<Result<HttpResponse>>
{
    auto url = parseUrl(request.url);
    if (!url)
        co_return std::unexpected(url.error());
    if (url->scheme != "http" && url->scheme != "https")
        co_return makeError(ErrorCode::InvalidArgument, std::format("Not an HTTP URL: {}", request.url));

    auto req = http::request<http::string_body> { toVerb(request.method), url->target, 11 };
    req.set(http::field::host, url->hostHeader());
    req.set(http::field::user_agent, "mcpdesk");
    for (const auto& [name, value]: request.headers)
        req.set(name, value);
    if (request.method != HttpMethod::Get || !request.body.empty())
    {
        req.body() = std::move(request.body);
        req.prepare_payload();
    }

    auto executor = co_await asio::this_coro::executor;
    auto response = http::response<http::string_body> {};
    auto failure = std::optional<Error> {};

    try
    {
        auto resolver = tcp::resolver(executor);
        auto const endpoints = co_await resolver.async_resolve(url->host, url->port, asio::use_awaitable);

        if (url->secure())
        {
            auto stream = beast::ssl_stream<beast::tcp_stream>(executor, tlsClientContext());
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str()))
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));

            beast::get_lowest_layer(stream).expires_after(request.timeout);
            co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);
            response = co_await roundTrip(stream, req);
        }
        else
        {
            auto stream = beast::tcp_stream(executor);
            stream.expires_after(request.timeout);
            co_await stream.async_connect(endpoints, asio::use_awaitable);
            response = co_await roundTrip(stream, req);

            auto ec = boost::system::error_code {};
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    catch (const boost::system::system_error& e)
    {
        if (e.code() == beast::error::timeout)
            failure = Error { ErrorCode::TimeoutError,
                              std::format("HTTP request to {} timeout after {} ms", request.url, request.timeout.count()) };
        else
            failure = Error { ErrorCode::TransportError,
                              std::format("HTTP request to {} failed: {}", request.url, e.code().message()) };
    }

    if (failure)
    {
        log::debug("{}", failure->message);
        co_return std::unexpected(std::move(*failure));
    }

    auto result = HttpResponse {};
    result.status = static_cast<int>(response.result_int());
    result.reason = std::string(response.reason());
    for (const auto& field: response)
        result.headers[toLower(field.name_string())] = std::string(field.value());
    result.body = std::move(response.body());
    co_return result;
}

HttpSession::HttpSession(std::string url, HttpHeaders headers, std::chrono::milliseconds timeout):
    _url(std::move(url)), _timeout(timeout)
{
    _headers["Content-Type"] = "application/json";
    _headers["Accept"] = "application/json";
    for (auto& [name, value]: headers)
        _headers[name] = std::move(value);
}

auto HttpSession::post(std::string body, const HttpHeaders& extraHeaders) -> asio::awaitable<Result<HttpResponse>>
{
    return exchange(HttpMethod::Post, std::move(body), extraHeaders);
}

auto HttpSession::get(const HttpHeaders& extraHeaders) -> asio::awaitable<Result<HttpResponse>>
{
    return exchange(HttpMethod::Get, {}, extraHeaders);
}

auto HttpSession::terminate() -> asio::awaitable<VoidResult>
{
    if (!_sessionId)
        co_return VoidResult {};

    auto response = co_await exchange(HttpMethod::Delete, {}, {});
    _sessionId.reset();

    if (!response)
        co_return std::unexpected(response.error());
    if (!response->ok() && response->status != 404 && response->status != 405)
        co_return makeError(ErrorCode::TransportError, describeHttpFailure(*response));
    co_return VoidResult {};
}

auto HttpSession::exchange(HttpMethod method, std::string body, const HttpHeaders& extraHeaders)
    -> asio::awaitable<Result<HttpResponse>>
{
    auto request = HttpRequest {
        .method = method,
        .url = _url,
        .headers = _headers,
        .body = std::move(body),
        .timeout = _timeout,
    };
    if (_sessionId)
        request.headers["Mcp-Session-Id"] = *_sessionId;
    for (const auto& [name, value]: extraHeaders)
        request.headers[name] = value;

    auto response = co_await sendHttpRequest(std::move(request));
    if (!response)
        co_return response;

    if (auto id = response->header("mcp-session-id"); id && !id->empty() && id != _sessionId)
    {
        log::debug("Session id for {}: {}", _url, *id);
        _sessionId = std::move(*id);
    }
    co_return response;
}

} // namespace mcpdesk
