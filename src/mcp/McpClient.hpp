// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/RequestCorrelator.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mcpdesk
{

/// @brief MCP protocol revision requested during initialize.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle (initialize, list tools, call tools) over any
/// Transport. Requests are correlated with their replies by id, so several may
/// be outstanding at once. When the transport closes, every outstanding request
/// fails with ErrorCode::ConnectionLost.
class McpClient
{
  public:
    using CloseHandler = std::function<void(const std::string& reason)>;

    McpClient(boost::asio::any_io_executor executor,
              std::shared_ptr<Transport> transport,
              std::string serverId,
              std::chrono::milliseconds requestTimeout = DefaultRequestTimeout);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Starts the transport and performs the initialize handshake.
    /// @param handshakeTimeout Time allowed for the initialize reply.
    /// @param stop Abandons the handshake with ErrorCode::Cancelled.
    [[nodiscard]] auto connect(std::optional<std::chrono::milliseconds> handshakeTimeout = std::nullopt,
                               std::stop_token stop = {}) -> boost::asio::awaitable<Result<McpServerCapabilities>>;

    /// @brief Lists available tools from the server.
    [[nodiscard]] auto listTools() -> boost::asio::awaitable<Result<std::vector<ToolDefinition>>>;

    /// @brief Calls a tool and returns the raw `result` object of the reply.
    [[nodiscard]] auto callTool(std::string_view name, nlohmann::json arguments, std::stop_token stop = {})
        -> boost::asio::awaitable<Result<nlohmann::json>>;

    /// @brief Sends a request and waits for its result.
    [[nodiscard]] auto request(std::string_view method,
                               nlohmann::json params = nullptr,
                               std::stop_token stop = {},
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> boost::asio::awaitable<Result<nlohmann::json>>;

    /// @brief Sends a notification; no reply is expected.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr)
        -> boost::asio::awaitable<VoidResult>;

    /// @brief Fails outstanding requests and closes the transport.
    auto close() -> boost::asio::awaitable<void>;

    /// @brief Installs a handler invoked when the transport closes on its own.
    void setCloseHandler(CloseHandler handler) { _closeHandler = std::move(handler); }

    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities& { return _capabilities; }
    [[nodiscard]] auto isInitialized() const -> bool { return _initialized; }
    [[nodiscard]] auto protocol() const -> TransportProtocol { return _transport->protocol(); }
    [[nodiscard]] auto transport() const -> const std::shared_ptr<Transport>& { return _transport; }
    [[nodiscard]] auto pendingRequests() const -> std::size_t { return _correlator.pendingCount(); }

  private:
    boost::asio::any_io_executor _executor;
    std::shared_ptr<Transport> _transport;
    RequestCorrelator _correlator;
    log::Logger _logger;
    McpServerCapabilities _capabilities;
    CloseHandler _closeHandler;
    int64_t _nextId = 1;
    bool _initialized = false;
    bool _closing = false;

    void handleMessage(nlohmann::json message);
    void handleClose(std::string reason);
    void answerRequest(const nlohmann::json& request);
};

} // namespace mcpdesk
