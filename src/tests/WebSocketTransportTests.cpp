// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>
#include <mcp/WebSocketTransport.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>

using namespace mcpdesk;
using namespace std::chrono_literals;

namespace
{

struct EventLog
{
    std::vector<nlohmann::json> messages;
    std::vector<Error> errors;
    std::optional<std::string> closeReason;

    void attach(Transport& transport)
    {
        transport.setEvents(TransportEvents {
            .onMessage = [this](nlohmann::json message) { messages.push_back(std::move(message)); },
            .onError = [this](const Error& error) { errors.push_back(error); },
            .onClose = [this](std::string reason) { closeReason = std::move(reason); },
        });
    }
};

auto pingRequest(int id) -> nlohmann::json
{
    return nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "method", "ping" } };
}

auto makeTransport(asio::io_context& io, WebSocketTransportConfig config) -> std::shared_ptr<WebSocketTransport>
{
    return std::make_shared<WebSocketTransport>(io.get_executor(), std::move(config), "ws", 2s);
}

} // namespace

TEST_CASE("WebSocketTransport rejects non-WebSocket URLs", "[transport]")
{
    auto io = asio::io_context {};
    auto transport = makeTransport(io, WebSocketTransportConfig { .url = "http://localhost/mcp" });

    auto const started = test::runAsync(io, transport->start());
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::InvalidArgument);
    CHECK(!transport->isConnected());
}

TEST_CASE("WebSocketTransport carries an MCP session", "[transport]")
{
    auto io = asio::io_context {};
    auto server = test::TestWebSocketServer(io);

    auto transport = makeTransport(io,
                                   WebSocketTransportConfig {
                                       .url = server.url(),
                                       .headers = { { "Authorization", "Bearer ws-token" } },
                                   });
    auto client = McpClient(io.get_executor(), transport, "ws", 2s);

    auto const capabilities = test::runAsync(io, client.connect());
    REQUIRE(capabilities.has_value());
    CHECK(capabilities->serverName == "websocket-server");
    CHECK(client.protocol() == TransportProtocol::WebSocket);

    REQUIRE(server.upgradeHeaders().size() == 1);
    CHECK(server.upgradeHeaders()[0].at("authorization") == "Bearer ws-token");

    auto const echoed = test::runAsync(io, client.callTool("echo", nlohmann::json { { "text", "framed" } }));
    REQUIRE(echoed.has_value());
    CHECK((*echoed)["content"][0]["text"] == "framed");

    test::runUntilDone(io, client.close());
    CHECK(!transport->isConnected());
}

TEST_CASE("WebSocketTransport reconnects and flushes queued messages", "[transport]")
{
    auto io = asio::io_context {};
    auto server = test::TestWebSocketServer(io);

    auto transport = makeTransport(io,
                                   WebSocketTransportConfig {
                                       .url = server.url(),
                                       .reconnectAttempts = 3,
                                       .reconnectDelay = 200ms,
                                   });
    auto events = EventLog {};
    events.attach(*transport);

    REQUIRE(test::runAsync(io, transport->start()).has_value());
    REQUIRE(transport->isConnected());

    server.dropSessions();
    REQUIRE(test::waitUntil(io, [&] { return !transport->isConnected(); }));

    // Sent while the reconnect delay is running.
    REQUIRE(test::runAsync(io, transport->send(pingRequest(11))).has_value());
    CHECK(transport->queuedCount() == 1);

    REQUIRE(test::waitUntil(io, [&] { return !events.messages.empty(); }));
    CHECK(events.messages.front()["id"] == 11);
    CHECK(transport->isConnected());
    CHECK(transport->queuedCount() == 0);
    CHECK(server.upgradeHeaders().size() == 2);
    CHECK(!events.closeReason.has_value());

    test::runUntilDone(io, transport->close());
    CHECK(events.closeReason == "Transport closed");
}

TEST_CASE("WebSocketTransport gives up after the configured attempts", "[transport]")
{
    auto io = asio::io_context {};
    auto server = std::make_unique<test::TestWebSocketServer>(io);

    auto transport = makeTransport(io,
                                   WebSocketTransportConfig {
                                       .url = server->url(),
                                       .reconnectAttempts = 2,
                                       .reconnectDelay = 10ms,
                                   });
    auto events = EventLog {};
    events.attach(*transport);

    REQUIRE(test::runAsync(io, transport->start()).has_value());
    server.reset();

    REQUIRE(test::waitUntil(io, [&] { return events.closeReason.has_value(); }));
    CHECK(events.closeReason == "Max reconnection attempts reached");
    CHECK(events.errors.size() == 2);
    CHECK(!transport->isConnected());

    auto const sent = test::runAsync(io, transport->send(pingRequest(1)));
    REQUIRE(!sent.has_value());
    CHECK(sent.error().code == ErrorCode::TransportError);
}

TEST_CASE("WebSocketTransport does not reconnect after close", "[transport]")
{
    auto io = asio::io_context {};
    auto server = test::TestWebSocketServer(io);

    auto transport = makeTransport(io,
                                   WebSocketTransportConfig {
                                       .url = server.url(),
                                       .reconnectDelay = 10ms,
                                   });
    auto events = EventLog {};
    events.attach(*transport);

    REQUIRE(test::runAsync(io, transport->start()).has_value());
    test::runUntilDone(io, transport->close());
    test::runFor(io, 100ms);

    CHECK(server.upgradeHeaders().size() == 1);
    CHECK(events.closeReason == "Transport closed");
}
