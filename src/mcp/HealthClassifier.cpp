// SPDX-License-Identifier: Apache-2.0
#include "HealthClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace mcpdesk
{

namespace
{
    constexpr std::string_view ConnectionPatterns[] = {
        "connection closed", "connection refused", "connection reset", "timeout",     "timed out",
        "disconnected",      "transport closed",   "broken pipe",      "-32000",      "-32001",
        "-32700",
    };

    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
        return lowered;
    }
} // namespace

auto classifyFailure(const Error& error) -> FailureKind
{
    switch (error.code)
    {
        case ErrorCode::ConnectionLost:
        case ErrorCode::TimeoutError: return FailureKind::ConnectionLevel;
        case ErrorCode::Cancelled: return FailureKind::Transient;
        default: break;
    }

    auto const message = toLower(error.message);
    for (auto const pattern: ConnectionPatterns)
    {
        if (message.find(pattern) != std::string::npos)
            return FailureKind::ConnectionLevel;
    }
    return FailureKind::Transient;
}

} // namespace mcpdesk
