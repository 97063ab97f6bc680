// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/McpClient.hpp>
#include <mcp/PollingTransport.hpp>
#include <mcp/RequestCorrelator.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/SimulatedSseTransport.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <stop_token>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Timing and fallback settings used when opening server connections.
struct ConnectOptions
{
    std::chrono::milliseconds requestTimeout = DefaultRequestTimeout;
    std::chrono::milliseconds handshakeTimeout = DefaultRequestTimeout;
    std::chrono::milliseconds simulatedReplyDelay = DefaultSimulatedReplyDelay;
    std::chrono::milliseconds pollInterval = DefaultPollInterval;
    std::chrono::milliseconds pollExpiry = DefaultPollExpiry;
    SimulatedCatalog simulatedCatalog = SimulatedCatalog::github();
};

/// @brief Returns true for hosts known to answer only over an unauthenticated event stream.
[[nodiscard]] auto requiresSimulatedSse(std::string_view url) -> bool;

/// @brief The protocols tried, in order, for an HTTP endpoint.
[[nodiscard]] auto httpFallbackChain(std::string_view url) -> std::vector<TransportProtocol>;

/// @brief Opens a transport for the server and completes the MCP handshake.
///
/// Stdio and WebSocket servers are connected directly. HTTP endpoints walk
/// httpFallbackChain(); each attempt gets a fresh transport and client, and every
/// failed attempt is closed before the next one starts.
/// @param stop Abandons the handshake in progress and skips the remaining fallbacks.
/// @return The connected client, or the combined failure of every attempt.
[[nodiscard]] auto connectServer(boost::asio::any_io_executor executor,
                                 const std::string& serverId,
                                 const ServerConfig& config,
                                 const ConnectOptions& options,
                                 std::stop_token stop = {})
    -> boost::asio::awaitable<Result<std::shared_ptr<McpClient>>>;

} // namespace mcpdesk
