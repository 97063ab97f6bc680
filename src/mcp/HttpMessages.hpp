// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Endpoint settings shared by the HTTP-class transports.
struct HttpTransportConfig
{
    std::string url;
    HttpHeaders headers;
};

/// @brief Extracts the `data:` payload of each event in a text/event-stream body.
///
/// Multi-line data fields are joined with '\n'; comment lines and events without
/// data are skipped.
[[nodiscard]] auto parseEventStream(std::string_view body) -> std::vector<std::string>;

/// @brief Decodes a body holding one JSON-RPC message or a batch array.
///
/// With @p allowNdjson, a body that is not a single JSON document is retried as
/// newline-delimited JSON, skipping lines that do not parse.
[[nodiscard]] auto decodeJsonMessages(std::string_view body, bool allowNdjson = false)
    -> std::vector<nlohmann::json>;

/// @brief Decodes the JSON-RPC messages carried by an HTTP response, based on its content type.
[[nodiscard]] auto decodeResponseMessages(const HttpResponse& response) -> std::vector<nlohmann::json>;

} // namespace mcpdesk
