// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/JsonRpc.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

namespace
{
    auto sendReply(std::shared_ptr<Transport> transport, nlohmann::json reply, log::Logger logger)
        -> asio::awaitable<void>
    {
        if (auto const sent = co_await transport->send(std::move(reply)); !sent)
            logger.warning("Failed to answer server request: {}", sent.error().message);
    }
} // namespace

McpClient::McpClient(asio::any_io_executor executor,
                     std::shared_ptr<Transport> transport,
                     std::string serverId,
                     std::chrono::milliseconds requestTimeout):
    _executor(executor),
    _transport(std::move(transport)),
    _correlator(executor, requestTimeout),
    _logger(std::format("mcp:{}", serverId))
{
    _transport->setEvents(TransportEvents {
        .onMessage = [this](nlohmann::json message) { handleMessage(std::move(message)); },
        .onError = [this](const Error& error) { _logger.warning("Transport error: {}", error.message); },
        .onClose = [this](std::string reason) { handleClose(std::move(reason)); },
    });
}

McpClient::~McpClient()
{
    // Background loops may still hold the transport; detach them from this object.
    _transport->setEvents({});
}

auto McpClient::connect(std::optional<std::chrono::milliseconds> handshakeTimeout, std::stop_token stop)
    -> asio::awaitable<Result<McpServerCapabilities>>
{
    if (auto const started = co_await _transport->start(); !started)
        co_return std::unexpected(started.error());

    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcpdesk" },
              { "version", "0.1.0" },
          } },
    };

    auto result = co_await request("initialize", std::move(params), std::move(stop), handshakeTimeout);
    if (!result)
        co_return std::unexpected(result.error());

    auto const serverInfo = result->value("serverInfo", nlohmann::json::object());
    _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
    _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
    _capabilities.protocolVersion = json::getStringOr(*result, "protocolVersion", "");

    if (auto const caps = result->find("capabilities"); caps != result->end() && caps->is_object())
    {
        _capabilities.hasTools = caps->contains("tools");
        _capabilities.hasResources = caps->contains("resources");
        _capabilities.hasPrompts = caps->contains("prompts");
    }

    if (auto const notified = co_await notify("notifications/initialized"); !notified)
        _logger.warning("Failed to send initialized notification: {}", notified.error().message);

    _initialized = true;
    _logger.info("MCP server initialized: {} v{} via {}",
                 _capabilities.serverName,
                 _capabilities.serverVersion,
                 protocolName(_transport->protocol()));

    co_return _capabilities;
}

auto McpClient::listTools() -> asio::awaitable<Result<std::vector<ToolDefinition>>>
{
    if (!_initialized)
        co_return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto result = co_await request("tools/list");
    if (!result)
        co_return std::unexpected(result.error());

    auto tools = std::vector<ToolDefinition> {};
    auto const list = result->find("tools");
    if (list == result->end() || !list->is_array())
        co_return tools;

    for (const auto& toolJson: *list)
    {
        if (!toolJson.is_object())
            continue;
        auto tool = ToolDefinition {
            .name = json::getStringOr(toolJson, "name", ""),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
        };
        if (tool.name.empty())
            continue;
        tools.push_back(std::move(tool));
    }

    co_return tools;
}

auto McpClient::callTool(std::string_view name, nlohmann::json arguments, std::stop_token stop)
    -> asio::awaitable<Result<nlohmann::json>>
{
    if (!_initialized)
        co_return makeError(ErrorCode::ProtocolError, "Client not initialized");

    if (arguments.is_null())
        arguments = nlohmann::json::object();

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", std::move(arguments) },
    };

    auto result = co_await request("tools/call", std::move(params), std::move(stop));
    if (result)
        _logger.debug("Tool '{}' returned: {}", name, result->dump());
    co_return result;
}

auto McpClient::request(std::string_view method,
                        nlohmann::json params,
                        std::stop_token stop,
                        std::optional<std::chrono::milliseconds> timeout) -> asio::awaitable<Result<nlohmann::json>>
{
    if (_closing)
        co_return makeError(ErrorCode::ConnectionLost, "Transport closed");

    auto const id = _nextId++;
    auto ticket = _correlator.expect(id, timeout);

    // Registered before sending: a transport may deliver the reply from inside send().
    if (auto const sent = co_await _transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
        _correlator.reject(id, sent.error());

    auto reply = co_await _correlator.wait(std::move(ticket), std::move(stop));
    if (!reply)
        co_return std::unexpected(reply.error());

    auto response = jsonrpc::parseResponse(*reply);
    if (!response)
        co_return std::unexpected(response.error());
    if (response->error)
        co_return std::unexpected(jsonrpc::toError(*response->error));

    co_return response->result.value_or(nlohmann::json::object());
}

auto McpClient::notify(std::string_view method, nlohmann::json params) -> asio::awaitable<VoidResult>
{
    co_return co_await _transport->send(jsonrpc::makeNotification(method, std::move(params)));
}

auto McpClient::close() -> asio::awaitable<void>
{
    _closing = true;
    _correlator.rejectAll(Error { ErrorCode::ConnectionLost, "Transport closed" });
    co_await _transport->close();
}

void McpClient::handleMessage(nlohmann::json message)
{
    switch (jsonrpc::classify(message))
    {
        case jsonrpc::MessageKind::Response: {
            auto const id = jsonrpc::requestId(message);
            if (!id || !_correlator.resolve(*id, std::move(message)))
                _logger.debug("Dropping reply without a pending request");
            break;
        }
        case jsonrpc::MessageKind::Request: answerRequest(message); break;
        case jsonrpc::MessageKind::Notification:
            _logger.debug("Notification: {}", json::getStringOr(message, "method", ""));
            break;
        case jsonrpc::MessageKind::Invalid: _logger.warning("Ignoring invalid message: {}", message.dump()); break;
    }
}

void McpClient::handleClose(std::string reason)
{
    _logger.info("Transport closed: {}", reason);
    _correlator.rejectAll(Error { ErrorCode::ConnectionLost, std::format("Transport closed: {}", reason) });

    if (!_closing && _closeHandler)
        _closeHandler(reason);
}

void McpClient::answerRequest(const nlohmann::json& request)
{
    auto const id = request["id"];
    auto const method = json::getStringOr(request, "method", "");

    auto reply = method == "ping"
                     ? jsonrpc::makeResult(id, nlohmann::json::object())
                     : jsonrpc::makeErrorResponse(
                           id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));
    if (method != "ping")
        _logger.debug("Rejecting unsupported server request '{}'", method);

    asio::co_spawn(_executor, sendReply(_transport, std::move(reply), _logger), asio::detached);
}

} // namespace mcpdesk
