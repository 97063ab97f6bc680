// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <vector>

namespace mcpdesk
{

/// @brief Conversation history handed to the model on every round of a turn.
///
/// The history is append-only. An assistant entry that requests tools is followed by one tool entry
/// per requested call before the next assistant or user entry.
class ChatSession
{
  public:
    /// @param systemPrompt Becomes the first entry when not empty.
    explicit ChatSession(std::string systemPrompt = "");

    void addUserMessage(std::string content);

    /// @param isError The text reports a failure rather than an answer.
    void addAssistantMessage(std::string content, std::vector<ToolCall> toolCalls = {}, bool isError = false);

    void addToolResult(std::string callId, std::string content, bool isError = false);

    [[nodiscard]] auto messages() const -> const std::vector<ChatMessage>&;

    /// @brief Ids of the latest assistant entry's tool calls that have no result yet, in call order.
    [[nodiscard]] auto unansweredToolCalls() const -> std::vector<std::string>;

  private:
    std::vector<ChatMessage> _messages;
};

} // namespace mcpdesk
