// SPDX-License-Identifier: Apache-2.0
#include "ChatSession.hpp"

#include <algorithm>
#include <utility>

namespace mcpdesk
{

ChatSession::ChatSession(std::string systemPrompt)
{
    if (!systemPrompt.empty())
        _messages.push_back(ChatMessage { .role = Role::System, .content = std::move(systemPrompt) });
}

void ChatSession::addUserMessage(std::string content)
{
    _messages.push_back(ChatMessage { .role = Role::User, .content = std::move(content) });
}

void ChatSession::addAssistantMessage(std::string content, std::vector<ToolCall> toolCalls, bool isError)
{
    _messages.push_back(ChatMessage {
        .role = Role::Assistant,
        .content = std::move(content),
        .toolCalls = std::move(toolCalls),
        .toolCallId = {},
        .isError = isError,
    });
}

void ChatSession::addToolResult(std::string callId, std::string content, bool isError)
{
    _messages.push_back(ChatMessage {
        .role = Role::Tool,
        .content = std::move(content),
        .toolCalls = {},
        .toolCallId = std::move(callId),
        .isError = isError,
    });
}

auto ChatSession::messages() const -> const std::vector<ChatMessage>&
{
    return _messages;
}

auto ChatSession::unansweredToolCalls() const -> std::vector<std::string>
{
    auto const request = std::ranges::find(_messages.rbegin(), _messages.rend(), Role::Assistant, &ChatMessage::role);
    if (request == _messages.rend())
        return {};

    auto unanswered = std::vector<std::string> {};
    for (const auto& call: request->toolCalls)
    {
        auto const answered = std::any_of(_messages.rbegin(), request, [&](const ChatMessage& message) {
            return message.role == Role::Tool && message.toolCallId == call.id;
        });
        if (!answered)
            unanswered.push_back(call.id);
    }
    return unanswered;
}

} // namespace mcpdesk
