// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/HttpMessages.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <string>

namespace mcpdesk
{

/// @brief MCP Streamable HTTP transport: one POST per message, replies in the response body.
///
/// A JSON or text/event-stream body is delivered as inbound messages. An empty
/// body for a request means the reply is pushed on a channel this transport does
/// not open, so the request is left to the correlator's timeout.
class StreamableHttpTransport: public Transport
{
  public:
    StreamableHttpTransport(HttpTransportConfig config,
                            std::string serverId,
                            std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));

    [[nodiscard]] auto start() -> boost::asio::awaitable<VoidResult> override;
    [[nodiscard]] auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> override;
    auto close() -> boost::asio::awaitable<void> override;
    [[nodiscard]] auto isConnected() const -> bool override { return _connected; }
    [[nodiscard]] auto protocol() const -> TransportProtocol override { return TransportProtocol::StreamableHttp; }

    [[nodiscard]] auto session() const -> const HttpSession& { return _session; }

  private:
    HttpSession _session;
    log::Logger _logger;
    bool _connected = false;
};

} // namespace mcpdesk
