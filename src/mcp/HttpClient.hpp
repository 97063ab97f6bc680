// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcpdesk
{

/// @brief The parts of an http(s) or ws(s) URL needed to open a connection.
struct Url
{
    std::string scheme; ///< Lowercased: "http", "https", "ws" or "wss".
    std::string host;
    std::string port;
    std::string target; ///< Path plus query, at least "/".

    [[nodiscard]] auto secure() const -> bool { return scheme == "https" || scheme == "wss"; }
    [[nodiscard]] auto hostHeader() const -> std::string;
};

/// @brief Shared TLS client context verifying peers against the system trust store.
[[nodiscard]] auto tlsClientContext() -> boost::asio::ssl::context&;

/// @brief Splits a URL into scheme, host, port and request target.
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<Url>;

enum class HttpMethod
{
    Get,
    Post,
    Delete,
};

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest
{
    HttpMethod method = HttpMethod::Post;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds timeout { 30'000 };
};

struct HttpResponse
{
    int status = 0;
    std::string reason;
    HttpHeaders headers; ///< Header names are lowercased.
    std::string body;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;
};

/// @brief Performs one HTTP/1.1 request on a fresh connection.
///
/// Network failures and timeouts are returned as errors; any HTTP status,
/// including 4xx and 5xx, is a successful exchange.
[[nodiscard]] auto sendHttpRequest(HttpRequest request) -> boost::asio::awaitable<Result<HttpResponse>>;

/// @brief Formats the failure message for a non-2xx response.
[[nodiscard]] auto describeHttpFailure(const HttpResponse& response) -> std::string;

/// @brief A sequence of requests against one MCP endpoint sharing a sticky session id.
///
/// Once a response carries `Mcp-Session-Id`, every later request sends it back.
class HttpSession
{
  public:
    HttpSession(std::string url, HttpHeaders headers, std::chrono::milliseconds timeout = std::chrono::seconds(30));

    /// @brief POSTs one JSON-RPC message body.
    [[nodiscard]] auto post(std::string body, const HttpHeaders& extraHeaders = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// @brief Issues a GET, used for polling queued replies.
    [[nodiscard]] auto get(const HttpHeaders& extraHeaders = {}) -> boost::asio::awaitable<Result<HttpResponse>>;

    /// @brief Sends DELETE to end the server-side session; does nothing without a session id.
    [[nodiscard]] auto terminate() -> boost::asio::awaitable<VoidResult>;

    [[nodiscard]] auto url() const -> const std::string& { return _url; }
    [[nodiscard]] auto sessionId() const -> const std::optional<std::string>& { return _sessionId; }

  private:
    std::string _url;
    HttpHeaders _headers;
    std::chrono::milliseconds _timeout;
    std::optional<std::string> _sessionId;

    auto exchange(HttpMethod method, std::string body, const HttpHeaders& extraHeaders)
        -> boost::asio::awaitable<Result<HttpResponse>>;
};

} // namespace mcpdesk
