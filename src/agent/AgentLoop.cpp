// SPDX-License-Identifier: Apache-2.0
#include "AgentLoop.hpp"

#include <algorithm>
#include <format>
#include <span>

namespace mcpdesk
{

namespace asio = boost::asio;

AgentLoop::AgentLoop(ChatModel& model, ChatSession& session, std::vector<CallableTool> tools, AgentConfig config):
    _model(model), _session(session), _tools(std::move(tools)), _config(std::move(config))
{
    _definitions.reserve(_tools.size());
    for (const auto& tool: _tools)
        _definitions.push_back(tool.definition);
}

auto AgentLoop::runTurn(std::string userMessage, std::stop_token stop, AgentStreamCallback streamCb)
    -> asio::awaitable<Result<TurnOutcome>>
{
    _pending.clear();
    setState(TurnState::Idle);
    _session.addUserMessage(std::move(userMessage));

    auto toolCalls = 0;
    auto const maxSteps = std::max(0, _config.maxToolSteps);

    for (auto round = 0; round <= maxSteps; ++round)
    {
        // The last round runs without tools so the model has to answer in text.
        auto const lastRound = round == maxSteps;
        auto const tools = lastRound ? std::span<const ToolDefinition> {} : std::span<const ToolDefinition>(_definitions);
        if (lastRound && round > 0)
            _logger.warning("Agent reached max tool steps ({}), forcing final response", maxSteps);

        _logger.debug("Agent round {}/{}", round + 1, maxSteps + 1);
        setState(TurnState::Generating);

        auto partial = std::string {};
        auto onToken = [&partial, &streamCb](std::string_view token) {
            partial += token;
            if (streamCb)
                streamCb(token);
        };

        auto result = co_await _model.streamRound(_session.messages(), tools, onToken, stop);

        if (stop.stop_requested() || (!result && result.error().code == ErrorCode::Cancelled))
            co_return abort(result ? result->text : std::move(partial), round + 1, toolCalls);

        if (!result)
            co_return failRound(result.error(), round + 1, toolCalls);

        if (!result->hasToolCalls() || lastRound)
        {
            if (result->hasToolCalls())
                _logger.warning("Ignoring {} tool call(s) requested after the step budget", result->toolCalls.size());
            _session.addAssistantMessage(result->text);
            setState(TurnState::Finished);
            co_return TurnOutcome {
                .state = TurnState::Finished,
                .text = std::move(result->text),
                .rounds = round + 1,
                .toolCalls = toolCalls,
            };
        }

        setState(TurnState::ToolsRequested);
        _logger.info("Model requested {} tool call(s)", result->toolCalls.size());
        for (const auto& call: result->toolCalls)
            _pending.insert_or_assign(call.id, ToolCallRecord { .name = call.name, .arguments = call.arguments });
        _session.addAssistantMessage(result->text, result->toolCalls);

        setState(TurnState::ToolsExecuting);
        for (const auto& call: result->toolCalls)
        {
            auto toolResult = co_await executeToolCall(call, stop);

            ++toolCalls;
            _pending.erase(call.id);
            _session.addToolResult(std::move(toolResult.callId), std::move(toolResult.content), toolResult.isError);

            if (stop.stop_requested())
            {
                // Every tool call in the history needs a result, even the abandoned ones.
                for (auto& skipped: _session.unansweredToolCalls())
                {
                    _pending.erase(skipped);
                    _session.addToolResult(std::move(skipped), std::string(CancelledToolResult), true);
                }
                co_return abort(std::move(result->text), round + 1, toolCalls, false);
            }
        }
    }

    // Not reached: the last round always finishes the turn.
    setState(TurnState::Finished);
    co_return TurnOutcome { .state = TurnState::Finished, .rounds = maxSteps + 1, .toolCalls = toolCalls };
}

void AgentLoop::setState(TurnState state)
{
    _state = state;
    if (_stateListener)
        _stateListener(state);
}

auto AgentLoop::executeToolCall(const ToolCall& call, std::stop_token stop) -> asio::awaitable<ToolResult>
{
    _logger.info("Executing tool: {} (id: {})", call.name, call.id);

    auto const tool = std::ranges::find(_tools, call.name, [](const CallableTool& t) { return t.definition.name; });
    if (tool == _tools.end())
    {
        co_return ToolResult {
            .callId = call.id,
            .content = std::format("Error: Tool '{}' not found", call.name),
            .isError = true,
        };
    }

    auto result = co_await tool->execute(call.arguments, std::move(stop));
    if (!result)
    {
        _logger.error("Tool call failed: {}", result.error().message);
        co_return ToolResult {
            .callId = call.id,
            .content = std::format("Error: {}", result.error().message),
            .isError = true,
        };
    }

    result->callId = call.id;
    co_return std::move(*result);
}

auto AgentLoop::abort(std::string partialText, int rounds, int toolCalls, bool recordText) -> TurnOutcome
{
    _logger.info("Turn stopped by user after {} round(s)", rounds);

    if (recordText && !partialText.empty())
        _session.addAssistantMessage(partialText);
    setState(TurnState::Aborted);

    return TurnOutcome {
        .state = TurnState::Aborted,
        .text = std::move(partialText),
        .stopped = true,
        .rounds = rounds,
        .toolCalls = toolCalls,
    };
}

auto AgentLoop::failRound(const Error& error, int rounds, int toolCalls) -> Result<TurnOutcome>
{
    setState(TurnState::Errored);

    if (error.message.find("does not support tools") != std::string::npos)
    {
        auto text = std::format("{}\n\n{}", error.message, ToolsUnsupportedHint);
        _session.addAssistantMessage(text, {}, true);
        return TurnOutcome {
            .state = TurnState::Errored,
            .text = std::move(text),
            .rounds = rounds,
            .toolCalls = toolCalls,
        };
    }

    _logger.error("Model round failed: {}", error.message);
    return makeError(ErrorCode::ModelError, error.message);
}

} // namespace mcpdesk
