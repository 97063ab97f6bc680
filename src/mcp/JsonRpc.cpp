// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <charconv>
#include <format>

namespace mcpdesk::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object())
        return MessageKind::Invalid;

    auto const hasId = message.contains("id") && !message["id"].is_null();

    if (message.contains("method") && message["method"].is_string())
        return hasId ? MessageKind::Request : MessageKind::Notification;

    if (message.contains("result") || message.contains("error"))
        return MessageKind::Response;

    return MessageKind::Invalid;
}

auto requestId(const nlohmann::json& message) -> std::optional<int64_t>
{
    if (!message.is_object() || !message.contains("id"))
        return std::nullopt;

    auto const& id = message["id"];
    if (id.is_number_integer())
        return id.get<int64_t>();

    // Some servers echo numeric ids back as strings.
    if (id.is_string())
    {
        auto const& text = id.get_ref<const std::string&>();
        auto value = int64_t {};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc {} && ptr == text.data() + text.size())
            return value;
    }

    return std::nullopt;
}

auto expectsReply(const nlohmann::json& message) -> bool
{
    return classify(message) == MessageKind::Request;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto toError(const RpcError& error) -> Error
{
    return Error {
        .code = ErrorCode::ProtocolError,
        .message = std::format("RPC error {}: {}", error.code, error.message),
    };
}

} // namespace mcpdesk::jsonrpc
