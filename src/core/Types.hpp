// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Converts a Role enum to its string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief A tool call request issued by the model.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief The result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    nlohmann::json raw;
    bool isError = false;
};

/// @brief Defines a tool that the model can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A single message in a chat conversation.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
    std::vector<ToolCall> toolCalls;
    std::string toolCallId; // For Role::Tool messages
    bool isError = false;
};

/// @brief Why a model round stopped producing output.
enum class FinishReason
{
    Stop,
    ToolCalls,
    Length,
};

/// @brief The outcome of one model round: text, tool calls, or both.
struct GenerateResult
{
    std::string text;
    std::vector<ToolCall> toolCalls;
    FinishReason finishReason = FinishReason::Stop;

    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }
};

} // namespace mcpdesk
