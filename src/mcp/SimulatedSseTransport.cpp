// SPDX-License-Identifier: Apache-2.0
#include "SimulatedSseTransport.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/JsonRpc.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

namespace
{
    constexpr auto GithubTools = R"([
  {
    "name": "search_repositories",
    "description": "Search for GitHub repositories",
    "inputSchema": {
      "type": "object",
      "properties": {
        "query": { "type": "string", "description": "Search query" },
        "page": { "type": "number", "description": "Page number" },
        "per_page": { "type": "number", "description": "Results per page" }
      },
      "required": ["query"]
    }
  },
  {
    "name": "get_file_contents",
    "description": "Get the contents of a file from a GitHub repository",
    "inputSchema": {
      "type": "object",
      "properties": {
        "owner": { "type": "string", "description": "Repository owner" },
        "repo": { "type": "string", "description": "Repository name" },
        "path": { "type": "string", "description": "File path" },
        "ref": { "type": "string", "description": "Branch, tag, or commit" }
      },
      "required": ["owner", "repo", "path"]
    }
  },
  {
    "name": "create_issue",
    "description": "Create a new issue in a GitHub repository",
    "inputSchema": {
      "type": "object",
      "properties": {
        "owner": { "type": "string", "description": "Repository owner" },
        "repo": { "type": "string", "description": "Repository name" },
        "title": { "type": "string", "description": "Issue title" },
        "body": { "type": "string", "description": "Issue body" },
        "labels": { "type": "array", "items": { "type": "string" }, "description": "Issue labels" }
      },
      "required": ["owner", "repo", "title"]
    }
  },
  {
    "name": "list_issues",
    "description": "List issues in a GitHub repository",
    "inputSchema": {
      "type": "object",
      "properties": {
        "owner": { "type": "string", "description": "Repository owner" },
        "repo": { "type": "string", "description": "Repository name" },
        "state": { "type": "string", "enum": ["open", "closed", "all"], "description": "Issue state" }
      },
      "required": ["owner", "repo"]
    }
  },
  {
    "name": "create_pull_request",
    "description": "Create a new pull request in a GitHub repository",
    "inputSchema": {
      "type": "object",
      "properties": {
        "owner": { "type": "string", "description": "Repository owner" },
        "repo": { "type": "string", "description": "Repository name" },
        "title": { "type": "string", "description": "PR title" },
        "body": { "type": "string", "description": "PR description" },
        "head": { "type": "string", "description": "Source branch" },
        "base": { "type": "string", "description": "Target branch" }
      },
      "required": ["owner", "repo", "title", "head", "base"]
    }
  }
])";
} // namespace

auto SimulatedCatalog::github() -> SimulatedCatalog
{
    return SimulatedCatalog {
        .serverInfo = { { "name", "GitHub MCP Server" }, { "version", "1.0.0" } },
        .tools = nlohmann::json::parse(GithubTools),
    };
}

SimulatedSseTransport::SimulatedSseTransport(asio::any_io_executor executor,
                                             HttpTransportConfig config,
                                             std::string serverId,
                                             SimulatedCatalog catalog,
                                             std::chrono::milliseconds replyDelay,
                                             std::chrono::milliseconds requestTimeout):
    _executor(std::move(executor)),
    _session(std::move(config.url), std::move(config.headers), requestTimeout),
    _catalog(std::move(catalog)),
    _replyDelay(replyDelay),
    _logger(std::format("sse-simulated:{}", serverId))
{
}

auto SimulatedSseTransport::start() -> asio::awaitable<VoidResult>
{
    if (auto url = parseUrl(_session.url()); !url)
        co_return std::unexpected(url.error());

    _connected = true;
    co_return VoidResult {};
}

auto SimulatedSseTransport::send(nlohmann::json message) -> asio::awaitable<VoidResult>
{
    if (!_connected)
        co_return makeError(ErrorCode::TransportError, "Transport not connected");

    auto self = shared_from_this();
    _logger.trace("-> {}", message.dump());

    auto response = co_await _session.post(message.dump());
    if (!response)
        co_return std::unexpected(response.error());
    if (!response->ok())
        co_return makeError(ErrorCode::TransportError, describeHttpFailure(*response));

    auto replies = decodeResponseMessages(*response);
    if (!replies.empty())
    {
        for (auto& reply: replies)
            emitMessage(std::move(reply));
        co_return VoidResult {};
    }

    if (jsonrpc::expectsReply(message))
    {
        _logger.debug("Empty response to '{}'; synthesizing reply",
                      json::getStringOr(message, "method", ""));
        scheduleReply(synthesizeReply(message));
    }
    co_return VoidResult {};
}

auto SimulatedSseTransport::close() -> asio::awaitable<void>
{
    _connected = false;

    auto timers = std::move(_timers);
    _timers.clear();
    for (const auto& timer: timers)
        timer->cancel();

    emitClose("Transport closed");
    co_return;
}

auto SimulatedSseTransport::synthesizeReply(const nlohmann::json& request) const -> nlohmann::json
{
    auto const id = request.value("id", nlohmann::json {});
    auto const method = json::getStringOr(request, "method", "");

    if (method == "initialize")
    {
        auto const params = request.value("params", nlohmann::json::object());
        return jsonrpc::makeResult(id,
                                   {
                                       { "protocolVersion", json::getStringOr(params, "protocolVersion", "2024-11-05") },
                                       { "capabilities", { { "tools", nlohmann::json::object() } } },
                                       { "serverInfo", _catalog.serverInfo },
                                   });
    }
    if (method == "tools/list")
        return jsonrpc::makeResult(id, { { "tools", _catalog.tools } });

    return jsonrpc::makeResult(id, nlohmann::json::object());
}

void SimulatedSseTransport::scheduleReply(nlohmann::json reply)
{
    auto timer = std::make_shared<asio::steady_timer>(_executor, _replyDelay);
    _timers.insert(timer);
    asio::co_spawn(_executor, deliverLater(shared_from_this(), timer, std::move(reply)), asio::detached);
}

auto SimulatedSseTransport::deliverLater(std::shared_ptr<SimulatedSseTransport> self,
                                         TimerPtr timer,
                                         nlohmann::json reply) -> asio::awaitable<void>
{
    auto ec = boost::system::error_code {};
    co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    _timers.erase(timer);

    if (ec || !_connected)
        co_return;

    _logger.trace("<- (synthesized) {}", reply.dump());
    emitMessage(std::move(reply));
}

} // namespace mcpdesk
