// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/ServerConfig.hpp>

#include <string>
#include <vector>

namespace mcpdesk
{

/// @brief Disjoint classification of server ids between two configuration snapshots.
///
/// Every id of either snapshot lands in exactly one list; each list is sorted.
struct ReconcilePlan
{
    std::vector<std::string> toAdd;
    std::vector<std::string> toRemove;
    std::vector<std::string> toRestart;
    std::vector<std::string> unchanged;

    [[nodiscard]] auto empty() const -> bool { return toAdd.empty() && toRemove.empty() && toRestart.empty(); }
};

/// @brief Returns true if moving from @p previous to @p next requires closing and reopening the connection.
///
/// Compares every field of ServerConfig and of each transport-specific shape.
/// A field added to any of these structs must also be compared here, otherwise
/// edits to it are silently ignored by reconciliation.
[[nodiscard]] auto requiresRestart(const ServerConfig& previous, const ServerConfig& next) -> bool;

/// @brief Computes the actions that move the running set from @p previous to @p next. Has no side effects.
[[nodiscard]] auto computeReconcilePlan(const ServerConfigMap& previous, const ServerConfigMap& next)
    -> ReconcilePlan;

} // namespace mcpdesk
