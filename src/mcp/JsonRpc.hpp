// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpdesk::jsonrpc
{

/// @brief Well-known JSON-RPC 2.0 and MCP error codes.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int ConnectionClosed = -32000;
    constexpr int RequestTimeout = -32001;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Shape of an inbound JSON-RPC message.
enum class MessageKind
{
    Request,
    Notification,
    Response,
    Invalid,
};

/// @brief Builds a JSON-RPC 2.0 request message.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Classifies a message as request, notification or response.
[[nodiscard]] auto classify(const nlohmann::json& message) -> MessageKind;

/// @brief Returns the numeric request id of a message, if it carries one.
[[nodiscard]] auto requestId(const nlohmann::json& message) -> std::optional<int64_t>;

/// @brief Returns true if the message expects a reply (carries a non-null id and a method).
[[nodiscard]] auto expectsReply(const nlohmann::json& message) -> bool;

/// @brief Parses a JSON-RPC 2.0 response.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Converts an RPC error into an Error, keeping the numeric code in the message.
[[nodiscard]] auto toError(const RpcError& error) -> Error;

} // namespace mcpdesk::jsonrpc
