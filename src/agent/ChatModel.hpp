// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <span>
#include <stop_token>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Callback receiving streamed text as the model produces it.
using TokenCallback = std::function<void(std::string_view token)>;

/// @brief A streaming chat model that may answer with text, tool calls, or both.
///
/// The provider behind it (local or remote) is not this library's concern.
class ChatModel
{
  public:
    virtual ~ChatModel() = default;

    /// @brief Generates one round of output for the conversation.
    ///
    /// Text is streamed through @p onToken as it arrives and is also returned in
    /// the result. When @p stop is requested the round ends early with
    /// ErrorCode::Cancelled; text already streamed stays with the caller.
    /// @param tools The tools the model may call this round; empty forces a text answer.
    [[nodiscard]] virtual auto streamRound(const std::vector<ChatMessage>& messages,
                                           std::span<const ToolDefinition> tools,
                                           TokenCallback onToken,
                                           std::stop_token stop) -> boost::asio::awaitable<Result<GenerateResult>> = 0;
};

} // namespace mcpdesk
