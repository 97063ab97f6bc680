// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string_view>

namespace mcpdesk
{

enum class FailureKind
{
    /// The connection to the server is no longer usable.
    ConnectionLevel,
    /// The call failed but the connection is fine.
    Transient,
};

[[nodiscard]] constexpr auto failureKindName(FailureKind kind) -> std::string_view
{
    switch (kind)
    {
        case FailureKind::ConnectionLevel: return "connection-level";
        case FailureKind::Transient: return "transient";
    }
    return "transient";
}

/// @brief Decides whether a failed call means the server connection is gone.
///
/// ConnectionLost and TimeoutError codes are always connection-level. Other errors
/// are matched, case-insensitively, against well-known phrases ("connection
/// refused", "timed out", "broken pipe" and the like) and against the JSON-RPC
/// codes -32000, -32001 and -32700 embedded in the message.
[[nodiscard]] auto classifyFailure(const Error& error) -> FailureKind;

[[nodiscard]] inline auto isConnectionLevel(const Error& error) -> bool
{
    return classifyFailure(error) == FailureKind::ConnectionLevel;
}

} // namespace mcpdesk
