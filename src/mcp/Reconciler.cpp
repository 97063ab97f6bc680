// SPDX-License-Identifier: Apache-2.0
#include "Reconciler.hpp"

#include <type_traits>
#include <variant>

namespace mcpdesk
{

namespace
{
    auto sameTransport(const StdioServerConfig& a, const StdioServerConfig& b) -> bool
    {
        return a.command == b.command && a.args == b.args && a.env == b.env && a.cwd == b.cwd;
    }

    auto sameTransport(const HttpServerConfig& a, const HttpServerConfig& b) -> bool
    {
        return a.url == b.url && a.headers == b.headers;
    }

    auto sameTransport(const WebSocketServerConfig& a, const WebSocketServerConfig& b) -> bool
    {
        return a.url == b.url && a.headers == b.headers && a.reconnectAttempts == b.reconnectAttempts
               && a.reconnectDelay == b.reconnectDelay;
    }
} // namespace

auto requiresRestart(const ServerConfig& previous, const ServerConfig& next) -> bool
{
    if (previous.enabled != next.enabled || previous.name != next.name || previous.description != next.description)
        return true;

    // A different transport kind is always a restart.
    if (previous.transport.index() != next.transport.index())
        return true;

    return std::visit(
        [&next](const auto& before) {
            using Shape = std::decay_t<decltype(before)>;
            return !sameTransport(before, std::get<Shape>(next.transport));
        },
        previous.transport);
}

auto computeReconcilePlan(const ServerConfigMap& previous, const ServerConfigMap& next) -> ReconcilePlan
{
    auto plan = ReconcilePlan {};

    for (const auto& [id, config]: previous)
    {
        auto const it = next.find(id);
        if (it == next.end())
            plan.toRemove.push_back(id);
        else if (requiresRestart(config, it->second))
            plan.toRestart.push_back(id);
        else
            plan.unchanged.push_back(id);
    }

    for (const auto& [id, config]: next)
    {
        if (!previous.contains(id))
            plan.toAdd.push_back(id);
    }

    return plan;
}

} // namespace mcpdesk
