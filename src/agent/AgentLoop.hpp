// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ChatModel.hpp>
#include <agent/ChatSession.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/ToolBridge.hpp>

#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Configuration for the agent loop.
struct AgentConfig
{
    int maxToolSteps = 10;
};

/// @brief Where a turn is in its generate / execute-tools cycle.
enum class TurnState
{
    Idle,
    Generating,
    ToolsRequested,
    ToolsExecuting,
    Finished,
    Aborted,
    Errored,
};

[[nodiscard]] constexpr auto turnStateName(TurnState state) -> std::string_view
{
    switch (state)
    {
        case TurnState::Idle: return "idle";
        case TurnState::Generating: return "generating";
        case TurnState::ToolsRequested: return "tools-requested";
        case TurnState::ToolsExecuting: return "tools-executing";
        case TurnState::Finished: return "finished";
        case TurnState::Aborted: return "aborted";
        case TurnState::Errored: return "errored";
    }
    return "idle";
}

/// @brief A tool call issued by the model whose result has not arrived yet.
struct ToolCallRecord
{
    std::string name;
    nlohmann::json arguments;
};

/// @brief How a turn ended.
struct TurnOutcome
{
    TurnState state = TurnState::Finished;
    /// Text of the final assistant entry; partial text if the turn was stopped.
    std::string text;
    /// The user stopped the turn. Not a failure.
    bool stopped = false;
    /// Number of model rounds run, including the final one.
    int rounds = 0;
    /// Number of tool calls executed.
    int toolCalls = 0;
};

/// @brief Text appended to a model error that says the model cannot use tools.
constexpr auto ToolsUnsupportedHint = std::string_view {
    "You can disable tools for this conversation in the MCP sidebar, or switch to a model that supports tools."
};

/// @brief Tool result recorded for calls skipped because the turn was stopped.
constexpr auto CancelledToolResult = std::string_view { "Error: Tool call cancelled" };

/// @brief Callback for streaming tokens to the user interface.
using AgentStreamCallback = std::function<void(std::string_view token)>;

/// @brief Drives one user turn through as many model and tool rounds as it needs.
///
/// Each round streams model output. A round that ends in tool calls has every
/// call executed in order, its result appended to the session, and the model is
/// asked again. The number of tool rounds is bounded by AgentConfig::maxToolSteps;
/// once the budget is spent, one more round runs without tools to force an answer.
/// Stopping the turn keeps whatever text was already streamed.
class AgentLoop
{
  public:
    using StateListener = std::function<void(TurnState)>;

    AgentLoop(ChatModel& model, ChatSession& session, std::vector<CallableTool> tools, AgentConfig config = {});

    /// @brief Processes a user message through the agent loop.
    /// @param userMessage The user's input text.
    /// @param stop Stops the turn; in-flight tool calls are abandoned locally.
    /// @param streamCb Optional callback for streaming tokens.
    /// @return How the turn ended, or ErrorCode::ModelError if the model failed.
    [[nodiscard]] auto runTurn(std::string userMessage, std::stop_token stop = {}, AgentStreamCallback streamCb = {})
        -> boost::asio::awaitable<Result<TurnOutcome>>;

    [[nodiscard]] auto state() const noexcept -> TurnState { return _state; }
    [[nodiscard]] auto pendingToolCalls() const -> const std::map<std::string, ToolCallRecord>& { return _pending; }
    [[nodiscard]] auto config() const -> const AgentConfig& { return _config; }

    void setStateListener(StateListener listener) { _stateListener = std::move(listener); }

  private:
    ChatModel& _model;
    ChatSession& _session;
    std::vector<CallableTool> _tools;
    std::vector<ToolDefinition> _definitions;
    AgentConfig _config;
    TurnState _state = TurnState::Idle;
    std::map<std::string, ToolCallRecord> _pending;
    StateListener _stateListener;
    log::Logger _logger { "agent" };

    void setState(TurnState state);
    auto executeToolCall(const ToolCall& call, std::stop_token stop) -> boost::asio::awaitable<ToolResult>;
    auto abort(std::string partialText, int rounds, int toolCalls, bool recordText = true) -> TurnOutcome;
    auto failRound(const Error& error, int rounds, int toolCalls) -> Result<TurnOutcome>;
};

} // namespace mcpdesk
