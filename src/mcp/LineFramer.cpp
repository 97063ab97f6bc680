// SPDX-License-Identifier: Apache-2.0
#include "LineFramer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace mcpdesk
{

namespace
{
    auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r") == std::string_view::npos;
    }
} // namespace

auto LineFramer::feed(std::string_view chunk) -> std::vector<nlohmann::json>
{
    _buffer.append(chunk);

    auto messages = std::vector<nlohmann::json> {};
    auto start = std::size_t { 0 };

    while (true)
    {
        auto const newlinePos = _buffer.find('\n', start);
        if (newlinePos == std::string::npos)
            break;

        auto const line = std::string_view(_buffer).substr(start, newlinePos - start);
        start = newlinePos + 1;

        if (isBlank(line))
            continue;

        auto parsed = json::parse(line);
        if (!parsed)
        {
            ++_dropped;
            log::warning("Dropping malformed line ({} bytes): {}", line.size(), parsed.error().message);
            continue;
        }

        messages.push_back(std::move(*parsed));
    }

    _buffer.erase(0, start);
    return messages;
}

} // namespace mcpdesk
