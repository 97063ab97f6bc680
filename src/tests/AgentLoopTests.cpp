// SPDX-License-Identifier: Apache-2.0
#include <agent/AgentLoop.hpp>
#include <agent/ChatModel.hpp>
#include <agent/ChatSession.hpp>
#include <core/Async.hpp>
#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

using namespace mcpdesk;
using mcpdesk::test::runAsync;

namespace
{

/// One scripted model round.
struct Step
{
    std::vector<std::string> tokens;
    std::vector<ToolCall> toolCalls;
    std::optional<Error> error;
    bool stopAfterTokens = false;
};

class ScriptedModel final: public ChatModel
{
  public:
    explicit ScriptedModel(std::vector<Step> steps): _steps(std::move(steps)) {}

    std::stop_source* stopSource = nullptr;
    std::vector<size_t> toolCountPerRound;
    std::vector<size_t> messageCountPerRound;

    auto streamRound(const std::vector<ChatMessage>& messages,
                     std::span<const ToolDefinition> tools,
                     TokenCallback onToken,
                     std::stop_token stop) -> asio::awaitable<Result<GenerateResult>> override
    {
        toolCountPerRound.push_back(tools.size());
        messageCountPerRound.push_back(messages.size());

        if (_next >= _steps.size())
            co_return makeError(ErrorCode::ModelError, "script exhausted");
        auto step = _steps[_next++];

        co_await sleepFor(std::chrono::milliseconds(1));

        auto text = std::string {};
        for (const auto& token: step.tokens)
        {
            text += token;
            onToken(token);
        }

        if (step.stopAfterTokens && stopSource)
        {
            stopSource->request_stop();
            co_return makeError(ErrorCode::Cancelled, "generation stopped");
        }
        if (stop.stop_requested())
            co_return makeError(ErrorCode::Cancelled, "generation stopped");

        if (step.error)
            co_return std::unexpected(*step.error);

        auto const reason = step.toolCalls.empty() ? FinishReason::Stop : FinishReason::ToolCalls;
        co_return GenerateResult { .text = std::move(text), .toolCalls = step.toolCalls, .finishReason = reason };
    }

  private:
    std::vector<Step> _steps;
    size_t _next = 0;
};

auto toolCall(std::string id, std::string name, nlohmann::json arguments = nlohmann::json::object()) -> ToolCall
{
    return ToolCall { .id = std::move(id), .name = std::move(name), .arguments = std::move(arguments) };
}

auto recordingEcho(std::vector<nlohmann::json>& seen, nlohmann::json arguments)
    -> asio::awaitable<Result<ToolResult>>
{
    co_await sleepFor(std::chrono::milliseconds(1));
    seen.push_back(arguments);
    co_return ToolResult { .content = arguments.value("text", std::string {}), .raw = arguments };
}

auto failing(nlohmann::json /*arguments*/) -> asio::awaitable<Result<ToolResult>>
{
    co_return makeError(ErrorCode::ToolCallError, "boom");
}

auto reportingError(nlohmann::json /*arguments*/) -> asio::awaitable<Result<ToolResult>>
{
    co_return ToolResult { .content = "disk full", .isError = true };
}

auto stoppingTool(std::stop_source& source) -> asio::awaitable<Result<ToolResult>>
{
    source.request_stop();
    co_return ToolResult { .content = "too late" };
}

auto echoTool(std::vector<nlohmann::json>& seen) -> CallableTool
{
    return CallableTool {
        .definition = ToolDefinition { .name = "alpha_echo",
                                       .description = "Echo text",
                                       .inputSchema = { { "type", "object" } } },
        .execute = [&seen](nlohmann::json arguments, std::stop_token) {
            return recordingEcho(seen, std::move(arguments));
        },
    };
}

auto failTool() -> CallableTool
{
    return CallableTool {
        .definition = ToolDefinition { .name = "alpha_fail", .description = "Always fails", .inputSchema = {} },
        .execute = [](nlohmann::json arguments, std::stop_token) { return failing(std::move(arguments)); },
    };
}

auto errorResultTool() -> CallableTool
{
    return CallableTool {
        .definition = ToolDefinition { .name = "alpha_write", .description = "Reports an error", .inputSchema = {} },
        .execute = [](nlohmann::json arguments, std::stop_token) { return reportingError(std::move(arguments)); },
    };
}

} // namespace

TEST_CASE("AgentLoop finishes a text-only turn in one round", "[agent]")
{
    auto io = asio::io_context {};
    auto model = ScriptedModel({ Step { .tokens = { "Hel", "lo" } } });
    auto session = ChatSession("system");
    auto seen = std::vector<nlohmann::json> {};
    auto loop = AgentLoop(model, session, { echoTool(seen) });

    auto states = std::vector<TurnState> {};
    loop.setStateListener([&states](TurnState state) { states.push_back(state); });
    auto streamed = std::string {};

    auto outcome = runAsync(io, loop.runTurn("hi", {}, [&streamed](std::string_view token) { streamed += token; }));

    REQUIRE(outcome.has_value());
    CHECK(outcome->state == TurnState::Finished);
    CHECK(outcome->text == "Hello");
    CHECK_FALSE(outcome->stopped);
    CHECK(outcome->rounds == 1);
    CHECK(outcome->toolCalls == 0);
    CHECK(streamed == "Hello");
    CHECK(model.toolCountPerRound == std::vector<size_t> { 1 });
    CHECK(states == std::vector { TurnState::Idle, TurnState::Generating, TurnState::Finished });
    CHECK(loop.state() == TurnState::Finished);

    REQUIRE(session.messages().size() == 3);
    CHECK(session.messages()[1].role == Role::User);
    CHECK(session.messages()[2].role == Role::Assistant);
    CHECK(session.messages()[2].content == "Hello");
}

TEST_CASE("AgentLoop executes tool calls in order and asks the model again", "[agent]")
{
    auto io = asio::io_context {};
    auto model = ScriptedModel({
        Step { .tokens = { "Checking." },
               .toolCalls = { toolCall("c1", "alpha_echo", { { "text", "one" } }),
                              toolCall("c2", "alpha_echo", { { "text", "two" } }) } },
        Step { .tokens = { "Done." } },
    });
    auto session = ChatSession("system");
    auto seen = std::vector<nlohmann::json> {};
    auto loop = AgentLoop(model, session, { echoTool(seen) });

    auto states = std::vector<TurnState> {};
    loop.setStateListener([&states](TurnState state) { states.push_back(state); });

    auto outcome = runAsync(io, loop.runTurn("do it"));

    REQUIRE(outcome.has_value());
    CHECK(outcome->state == TurnState::Finished);
    CHECK(outcome->text == "Done.");
    CHECK(outcome->rounds == 2);
    CHECK(outcome->toolCalls == 2);
    CHECK(loop.pendingToolCalls().empty());

    REQUIRE(seen.size() == 2);
    CHECK(seen[0]["text"] == "one");
    CHECK(seen[1]["text"] == "two");

    CHECK(states
          == std::vector { TurnState::Idle,
                           TurnState::Generating,
                           TurnState::ToolsRequested,
                           TurnState::ToolsExecuting,
                           TurnState::Generating,
                           TurnState::Finished });

    // The second round sees the assistant entry and both tool results.
    CHECK(model.messageCountPerRound == std::vector<size_t> { 2, 5 });

    const auto& messages = session.messages();
    REQUIRE(messages.size() == 6);
    CHECK(messages[2].role == Role::Assistant);
    CHECK(messages[2].content == "Checking.");
    CHECK(messages[2].toolCalls.size() == 2);
    CHECK(messages[3].role == Role::Tool);
    CHECK(messages[3].toolCallId == "c1");
    CHECK(messages[3].content == "one");
    CHECK(messages[4].toolCallId == "c2");
    CHECK(messages[4].content == "two");
    CHECK(messages[5].content == "Done.");
}

TEST_CASE("AgentLoop forces a final answer once the step budget is spent", "[agent]")
{
    auto io = asio::io_context {};
    auto seen = std::vector<nlohmann::json> {};
    auto session = ChatSession();

    SECTION("model answers in text on the last round")
    {
        auto model = ScriptedModel({
            Step { .toolCalls = { toolCall("c1", "alpha_echo") } },
            Step { .toolCalls = { toolCall("c2", "alpha_echo") } },
            Step { .tokens = { "final" } },
        });
        auto loop = AgentLoop(model, session, { echoTool(seen) }, AgentConfig { .maxToolSteps = 2 });

        auto outcome = runAsync(io, loop.runTurn("loop"));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Finished);
        CHECK(outcome->text == "final");
        CHECK(outcome->rounds == 3);
        CHECK(outcome->toolCalls == 2);
        CHECK(model.toolCountPerRound == std::vector<size_t> { 1, 1, 0 });
    }

    SECTION("tool calls on the last round are ignored")
    {
        auto model = ScriptedModel({
            Step { .toolCalls = { toolCall("c1", "alpha_echo") } },
            Step { .tokens = { "still want tools" }, .toolCalls = { toolCall("c2", "alpha_echo") } },
        });
        auto loop = AgentLoop(model, session, { echoTool(seen) }, AgentConfig { .maxToolSteps = 1 });

        auto outcome = runAsync(io, loop.runTurn("loop"));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Finished);
        CHECK(outcome->text == "still want tools");
        CHECK(outcome->toolCalls == 1);
        CHECK(seen.size() == 1);
        CHECK(session.messages().back().toolCalls.empty());
    }

    SECTION("a zero budget offers no tools at all")
    {
        auto model = ScriptedModel({ Step { .tokens = { "plain" } } });
        auto loop = AgentLoop(model, session, { echoTool(seen) }, AgentConfig { .maxToolSteps = 0 });

        auto outcome = runAsync(io, loop.runTurn("hi"));

        REQUIRE(outcome.has_value());
        CHECK(outcome->rounds == 1);
        CHECK(model.toolCountPerRound == std::vector<size_t> { 0 });
    }
}

TEST_CASE("AgentLoop keeps partial text when the turn is stopped", "[agent]")
{
    auto io = asio::io_context {};
    auto session = ChatSession("system");
    auto source = std::stop_source {};

    SECTION("during generation")
    {
        auto model = ScriptedModel({ Step { .tokens = { "Par", "tial" }, .stopAfterTokens = true } });
        model.stopSource = &source;
        auto loop = AgentLoop(model, session, {});

        auto outcome = runAsync(io, loop.runTurn("hi", source.get_token()));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Aborted);
        CHECK(outcome->stopped);
        CHECK(outcome->text == "Partial");
        CHECK(loop.state() == TurnState::Aborted);
        CHECK(session.messages().back().role == Role::Assistant);
        CHECK(session.messages().back().content == "Partial");
        CHECK_FALSE(session.messages().back().isError);
    }

    SECTION("during tool execution")
    {
        auto model = ScriptedModel({
            Step { .tokens = { "Let me look." }, .toolCalls = { toolCall("c1", "alpha_stop"), toolCall("c2", "alpha_stop") } },
            Step { .tokens = { "never" } },
        });
        auto stopper = CallableTool {
            .definition = ToolDefinition { .name = "alpha_stop", .description = "Stops the turn", .inputSchema = {} },
            .execute = [&source](nlohmann::json, std::stop_token) { return stoppingTool(source); },
        };
        auto loop = AgentLoop(model, session, { stopper });

        auto outcome = runAsync(io, loop.runTurn("hi", source.get_token()));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Aborted);
        CHECK(outcome->stopped);
        CHECK(outcome->text == "Let me look.");
        CHECK(outcome->rounds == 1);
        CHECK(outcome->toolCalls == 1);
        CHECK(model.toolCountPerRound.size() == 1);
        CHECK(loop.pendingToolCalls().empty());

        // Every requested call is answered: the finished one with its result, the skipped one as cancelled.
        const auto& messages = session.messages();
        REQUIRE(messages.size() == 5);
        REQUIRE(messages[2].toolCalls.size() == 2);
        CHECK(messages[3].role == Role::Tool);
        CHECK(messages[3].toolCallId == "c1");
        CHECK(messages[3].content == "too late");
        CHECK_FALSE(messages[3].isError);
        CHECK(messages[4].role == Role::Tool);
        CHECK(messages[4].toolCallId == "c2");
        CHECK(messages[4].content == CancelledToolResult);
        CHECK(messages[4].isError);
        CHECK(session.unansweredToolCalls().empty());
    }

    SECTION("nothing streamed adds no assistant entry")
    {
        auto model = ScriptedModel({ Step { .stopAfterTokens = true } });
        model.stopSource = &source;
        auto loop = AgentLoop(model, session, {});

        auto outcome = runAsync(io, loop.runTurn("hi", source.get_token()));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Aborted);
        CHECK(outcome->text.empty());
        CHECK(session.messages().back().role == Role::User);
    }
}

TEST_CASE("AgentLoop reports model failures", "[agent]")
{
    auto io = asio::io_context {};
    auto session = ChatSession("system");

    SECTION("a model without tool support yields an inline hint")
    {
        auto model = ScriptedModel({
            Step { .error = Error { ErrorCode::ModelError, "registry.ollama.ai/library/gemma does not support tools" } },
        });
        auto loop = AgentLoop(model, session, {});

        auto outcome = runAsync(io, loop.runTurn("hi"));

        REQUIRE(outcome.has_value());
        CHECK(outcome->state == TurnState::Errored);
        CHECK_FALSE(outcome->stopped);
        CHECK(outcome->text.starts_with("registry.ollama.ai/library/gemma does not support tools"));
        CHECK(outcome->text.ends_with(ToolsUnsupportedHint));
        CHECK(loop.state() == TurnState::Errored);
        CHECK(session.messages().back().role == Role::Assistant);
        CHECK(session.messages().back().isError);
    }

    SECTION("other errors propagate as model errors")
    {
        auto model = ScriptedModel({ Step { .error = Error { ErrorCode::IoError, "connection refused" } } });
        auto loop = AgentLoop(model, session, {});

        auto outcome = runAsync(io, loop.runTurn("hi"));

        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::ModelError);
        CHECK(outcome.error().message == "connection refused");
        CHECK(loop.state() == TurnState::Errored);
        CHECK(session.messages().back().role == Role::User);
    }
}

TEST_CASE("AgentLoop feeds tool failures back to the model", "[agent]")
{
    auto io = asio::io_context {};
    auto session = ChatSession();
    auto model = ScriptedModel({
        Step { .toolCalls = { toolCall("c1", "alpha_fail"), toolCall("c2", "alpha_write"), toolCall("c3", "nope") } },
        Step { .tokens = { "Sorry." } },
    });
    auto loop = AgentLoop(model, session, { failTool(), errorResultTool() });

    auto outcome = runAsync(io, loop.runTurn("try"));

    REQUIRE(outcome.has_value());
    CHECK(outcome->state == TurnState::Finished);
    CHECK(outcome->text == "Sorry.");
    CHECK(outcome->toolCalls == 3);

    const auto& messages = session.messages();
    REQUIRE(messages.size() == 6);
    CHECK(messages[2].toolCallId == "c1");
    CHECK(messages[2].content == "Error: boom");
    CHECK(messages[2].isError);
    CHECK(messages[3].toolCallId == "c2");
    CHECK(messages[3].content == "disk full");
    CHECK(messages[3].isError);
    CHECK(messages[4].toolCallId == "c3");
    CHECK(messages[4].content == "Error: Tool 'nope' not found");
    CHECK(messages[4].isError);
}

TEST_CASE("Turn state names", "[agent]")
{
    CHECK(turnStateName(TurnState::Idle) == "idle");
    CHECK(turnStateName(TurnState::ToolsRequested) == "tools-requested");
    CHECK(turnStateName(TurnState::ToolsExecuting) == "tools-executing");
    CHECK(turnStateName(TurnState::Aborted) == "aborted");
    CHECK(turnStateName(TurnState::Errored) == "errored");
}
