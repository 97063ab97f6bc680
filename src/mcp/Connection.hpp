// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/McpClient.hpp>
#include <mcp/ServerConfig.hpp>

#include <memory>
#include <string>

namespace mcpdesk
{

/// @brief A live server: its id, the configuration it was started from, and the client speaking to it.
///
/// Owned by ServerManager. The transport is owned by the client.
struct Connection
{
    std::string serverId;
    ServerConfig config;
    std::shared_ptr<McpClient> client;

    [[nodiscard]] auto transport() const -> const std::shared_ptr<Transport>& { return client->transport(); }
    [[nodiscard]] auto protocol() const -> TransportProtocol { return client->protocol(); }
};

} // namespace mcpdesk
