// SPDX-License-Identifier: Apache-2.0
#include "HttpMessages.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace mcpdesk
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    void appendMessages(nlohmann::json document, std::vector<nlohmann::json>& out)
    {
        if (document.is_array())
        {
            for (auto& item: document)
                out.push_back(std::move(item));
        }
        else
        {
            out.push_back(std::move(document));
        }
    }
} // namespace

auto parseEventStream(std::string_view body) -> std::vector<std::string>
{
    auto events = std::vector<std::string> {};
    auto data = std::string {};
    auto hasData = false;

    auto flush = [&] {
        if (hasData)
            events.push_back(std::move(data));
        data.clear();
        hasData = false;
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto line = body.substr(0, eol);
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);
        if (line.ends_with('\r'))
            line.remove_suffix(1);

        if (line.empty())
        {
            flush();
            continue;
        }
        if (line.starts_with(':'))
            continue;

        auto const colon = line.find(':');
        auto const field = line.substr(0, colon);
        if (field != "data")
            continue;

        auto value = colon == std::string_view::npos ? std::string_view {} : line.substr(colon + 1);
        if (value.starts_with(' '))
            value.remove_prefix(1);

        if (hasData)
            data += '\n';
        data += value;
        hasData = true;
    }
    flush();

    return events;
}

auto decodeJsonMessages(std::string_view body, bool allowNdjson) -> std::vector<nlohmann::json>
{
    auto messages = std::vector<nlohmann::json> {};
    auto const text = trim(body);
    if (text.empty())
        return messages;

    if (auto document = json::parse(text); document)
    {
        appendMessages(std::move(*document), messages);
        return messages;
    }
    else if (!allowNdjson)
    {
        log::warning("Discarding non-JSON response body: {}", document.error().message);
        return messages;
    }

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto const line = trim(body.substr(0, eol));
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);
        if (line.empty())
            continue;

        if (auto document = json::parse(line); document)
            appendMessages(std::move(*document), messages);
        else
            log::warning("Skipping malformed line: {}", document.error().message);
    }
    return messages;
}

auto decodeResponseMessages(const HttpResponse& response) -> std::vector<nlohmann::json>
{
    auto const contentType = response.header("content-type").value_or("");
    if (contentType.find("text/event-stream") == std::string::npos)
        return decodeJsonMessages(response.body);

    auto messages = std::vector<nlohmann::json> {};
    for (const auto& data: parseEventStream(response.body))
    {
        if (auto document = json::parse(data); document)
            appendMessages(std::move(*document), messages);
        else
            log::warning("Skipping malformed event: {}", document.error().message);
    }
    return messages;
}

} // namespace mcpdesk
