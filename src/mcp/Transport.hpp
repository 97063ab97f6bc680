// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace mcpdesk
{

/// @brief The concrete wire protocol a transport speaks.
enum class TransportProtocol
{
    Stdio,
    StreamableHttp,
    SimulatedSse,
    Polling,
    WebSocket,
};

[[nodiscard]] constexpr auto protocolName(TransportProtocol protocol) -> std::string_view
{
    switch (protocol)
    {
        case TransportProtocol::Stdio: return "stdio";
        case TransportProtocol::StreamableHttp: return "streamable-http";
        case TransportProtocol::SimulatedSse: return "sse-simulated";
        case TransportProtocol::Polling: return "polling";
        case TransportProtocol::WebSocket: return "websocket";
    }
    return "unknown";
}

/// @brief Event sinks a transport reports to.
///
/// All three are installed together through Transport::setEvents() before start(),
/// so no event can be observed by a partially wired consumer.
struct TransportEvents
{
    std::function<void(nlohmann::json message)> onMessage;
    std::function<void(const Error& error)> onError;
    std::function<void(std::string reason)> onClose;
};

/// @brief Abstract interface for MCP transport communication.
///
/// Transports run on a single Asio executor. Inbound messages are delivered
/// through TransportEvents::onMessage in receipt order.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Installs the event sinks. Must be called before start().
    void setEvents(TransportEvents events) { _events = std::move(events); }

    /// @brief Establishes readiness (spawns the process, opens the socket, ...).
    [[nodiscard]] virtual auto start() -> boost::asio::awaitable<VoidResult> = 0;

    /// @brief Transmits one JSON-RPC message.
    [[nodiscard]] virtual auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> = 0;

    /// @brief Releases all resources, including background timers and sockets.
    virtual auto close() -> boost::asio::awaitable<void> = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    [[nodiscard]] virtual auto protocol() const -> TransportProtocol = 0;

  protected:
    void emitMessage(nlohmann::json message)
    {
        if (_events.onMessage)
            _events.onMessage(std::move(message));
    }

    void emitError(const Error& error)
    {
        if (_events.onError)
            _events.onError(error);
    }

    /// @brief Reports closure once; later calls are ignored.
    void emitClose(std::string reason)
    {
        if (_closeReported)
            return;
        _closeReported = true;
        if (_events.onClose)
            _events.onClose(std::move(reason));
    }

  private:
    TransportEvents _events;
    bool _closeReported = false;
};

} // namespace mcpdesk
