// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpClient.hpp>
#include <mcp/HttpMessages.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/PollingTransport.hpp>
#include <mcp/SimulatedSseTransport.hpp>
#include <mcp/StreamableHttpTransport.hpp>
#include <mcp/TransportNegotiator.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <deque>

using namespace mcpdesk;
using namespace std::chrono_literals;

using test::TestHttpServer;

namespace
{

/// Answers every MCP request in the response body and hands out a session id on initialize.
auto sessionServer(const TestHttpServer::Request& request) -> TestHttpServer::Reply
{
    if (request.method == "DELETE")
        return TestHttpServer::Reply { .status = 200, .contentType = "" };

    auto const message = nlohmann::json::parse(request.body, nullptr, false);
    auto const reply = test::answerMcpRequest(message, "http-server");
    if (!reply)
        return TestHttpServer::Reply { .status = 202, .contentType = "" };

    auto out = TestHttpServer::Reply { .body = reply->dump() };
    if (message.value("method", "") == "initialize")
        out.headers["Mcp-Session-Id"] = "session-123";
    return out;
}

/// Acknowledges every POST with an empty body.
auto silentServer(const TestHttpServer::Request&) -> TestHttpServer::Reply
{
    return TestHttpServer::Reply { .status = 202, .contentType = "" };
}

auto httpConfig(std::string url) -> ServerConfig
{
    return ServerConfig { .name = "remote", .transport = HttpServerConfig { .url = std::move(url) } };
}

auto quickOptions() -> ConnectOptions
{
    auto options = ConnectOptions {};
    options.requestTimeout = 1s;
    options.handshakeTimeout = 300ms;
    options.simulatedReplyDelay = 10ms;
    options.pollInterval = 20ms;
    return options;
}

} // namespace

TEST_CASE("parseUrl splits scheme, host, port and target", "[http]")
{
    auto const plain = parseUrl("http://localhost:8080/mcp?x=1#frag");
    REQUIRE(plain.has_value());
    CHECK(plain->scheme == "http");
    CHECK(plain->host == "localhost");
    CHECK(plain->port == "8080");
    CHECK(plain->target == "/mcp?x=1");
    CHECK(!plain->secure());
    CHECK(plain->hostHeader() == "localhost:8080");

    auto const tls = parseUrl("HTTPS://user@api.example.com");
    REQUIRE(tls.has_value());
    CHECK(tls->scheme == "https");
    CHECK(tls->host == "api.example.com");
    CHECK(tls->port == "443");
    CHECK(tls->target == "/");
    CHECK(tls->secure());
    CHECK(tls->hostHeader() == "api.example.com");

    auto const ipv6 = parseUrl("ws://[::1]:9000/socket");
    REQUIRE(ipv6.has_value());
    CHECK(ipv6->host == "::1");
    CHECK(ipv6->port == "9000");
    CHECK(ipv6->hostHeader() == "[::1]:9000");
}

TEST_CASE("parseUrl rejects malformed URLs", "[http]")
{
    for (auto const* url: { "localhost/mcp", "ftp://host/x", "http:///path", "http://host:port/", "http://[::1/x" })
    {
        INFO(url);
        auto const parsed = parseUrl(url);
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("parseEventStream extracts data payloads", "[http]")
{
    auto const body = std::string {
        ": keep-alive\n"
        "event: message\n"
        "data: {\"id\":1}\n"
        "\n"
        "id: 7\r\n"
        "data: {\"id\":\r\n"
        "data: 2}\r\n"
        "\r\n"
        "event: ping\n"
        "\n"
        "data:{\"id\":3}"
    };

    auto const events = parseEventStream(body);
    REQUIRE(events.size() == 3);
    CHECK(events[0] == "{\"id\":1}");
    CHECK(events[1] == "{\"id\":\n2}");
    CHECK(events[2] == "{\"id\":3}");
}

TEST_CASE("decodeJsonMessages handles documents, batches and NDJSON", "[http]")
{
    CHECK(decodeJsonMessages("").empty());
    CHECK(decodeJsonMessages("  \r\n").empty());

    auto const single = decodeJsonMessages(R"({"id": 1})");
    REQUIRE(single.size() == 1);

    auto const batch = decodeJsonMessages(R"([{"id": 1}, {"id": 2}])");
    REQUIRE(batch.size() == 2);
    CHECK(batch[1]["id"] == 2);

    auto const ndjson = std::string { "{\"id\": 1}\nnot json\n{\"id\": 2}\n" };
    CHECK(decodeJsonMessages(ndjson).empty());
    auto const lines = decodeJsonMessages(ndjson, true);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[1]["id"] == 2);
}

TEST_CASE("decodeResponseMessages follows the content type", "[http]")
{
    auto response = HttpResponse {
        .status = 200,
        .headers = { { "content-type", "text/event-stream; charset=utf-8" } },
        .body = "data: {\"id\": 5}\n\ndata: [{\"id\": 6}]\n\n",
    };
    auto const messages = decodeResponseMessages(response);
    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["id"] == 5);
    CHECK(messages[1]["id"] == 6);

    response.headers["content-type"] = "application/json";
    response.body = R"({"id": 9})";
    REQUIRE(decodeResponseMessages(response).size() == 1);
}

TEST_CASE("describeHttpFailure includes status, reason and body", "[http]")
{
    auto const response = HttpResponse { .status = 503, .reason = "Service Unavailable", .body = "try later" };
    CHECK(describeHttpFailure(response) == "HTTP 503: Service Unavailable. Body: try later");
    CHECK(!response.ok());
}

TEST_CASE("StreamableHttpTransport keeps the session id and ends the session on close", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, sessionServer);

    auto transport = std::make_shared<StreamableHttpTransport>(
        HttpTransportConfig { .url = server.url(), .headers = { { "Authorization", "Bearer secret" } } }, "remote");
    auto client = McpClient(io.get_executor(), transport, "remote", 2s);

    REQUIRE(test::runAsync(io, client.connect()).has_value());
    CHECK(client.capabilities().serverName == "http-server");
    CHECK(transport->session().sessionId() == "session-123");

    auto const echoed = test::runAsync(io, client.callTool("echo", nlohmann::json { { "text", "over http" } }));
    REQUIRE(echoed.has_value());
    CHECK((*echoed)["content"][0]["text"] == "over http");

    test::runUntilDone(io, client.close());

    auto const& requests = server.requests();
    REQUIRE(requests.size() == 4); // initialize, initialized notification, tools/call, DELETE
    CHECK(requests[0].header("mcp-session-id").empty());
    CHECK(requests[0].header("accept").find("text/event-stream") != std::string::npos);
    CHECK(requests[0].header("authorization") == "Bearer secret");
    for (auto i = 1u; i < requests.size(); ++i)
        CHECK(requests[i].header("mcp-session-id") == "session-123");
    CHECK(requests[3].method == "DELETE");
    CHECK(!transport->session().sessionId().has_value());
}

TEST_CASE("StreamableHttpTransport accepts event-stream replies", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, [](const TestHttpServer::Request& request) {
        auto reply = sessionServer(request);
        if (reply.status == 200 && !reply.body.empty())
        {
            reply.contentType = "text/event-stream";
            reply.body = "event: message\ndata: " + reply.body + "\n\n";
        }
        return reply;
    });

    auto transport = std::make_shared<StreamableHttpTransport>(HttpTransportConfig { .url = server.url() }, "remote");
    auto client = McpClient(io.get_executor(), transport, "remote", 2s);

    REQUIRE(test::runAsync(io, client.connect()).has_value());
    auto const tools = test::runAsync(io, client.listTools());
    REQUIRE(tools.has_value());
    CHECK(tools->size() == 2);

    test::runUntilDone(io, client.close());
}

TEST_CASE("StreamableHttpTransport reports HTTP errors", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, [](const TestHttpServer::Request&) {
        return TestHttpServer::Reply { .status = 500, .contentType = "text/plain", .body = "boom" };
    });

    auto transport = std::make_shared<StreamableHttpTransport>(HttpTransportConfig { .url = server.url() }, "remote");
    REQUIRE(test::runAsync(io, transport->start()).has_value());

    auto const sent = test::runAsync(io, transport->send(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "method", "ping" } }));
    REQUIRE(!sent.has_value());
    CHECK(sent.error().code == ErrorCode::TransportError);
    CHECK(sent.error().message.starts_with("HTTP 500"));
    CHECK(sent.error().message.ends_with("Body: boom"));
}

TEST_CASE("SimulatedSseTransport synthesizes replies for empty responses", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, silentServer);

    auto catalog = SimulatedCatalog {
        .serverInfo = { { "name", "Catalog Server" }, { "version", "2.0" } },
        .tools = nlohmann::json::array({ { { "name", "lookup" }, { "description", "Looks things up" } } }),
    };
    auto transport = std::make_shared<SimulatedSseTransport>(
        io.get_executor(), HttpTransportConfig { .url = server.url() }, "remote", catalog, 10ms);
    auto client = McpClient(io.get_executor(), transport, "remote", 2s);

    REQUIRE(test::runAsync(io, client.connect()).has_value());
    CHECK(client.capabilities().serverName == "Catalog Server");
    CHECK(client.protocol() == TransportProtocol::SimulatedSse);

    auto const tools = test::runAsync(io, client.listTools());
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "lookup");

    auto const called = test::runAsync(io, client.callTool("lookup", nlohmann::json::object()));
    REQUIRE(called.has_value());
    CHECK(*called == nlohmann::json::object());

    test::runUntilDone(io, client.close());
    CHECK(transport->scheduledReplies() == 0);
}

TEST_CASE("SimulatedSseTransport passes real replies through", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, sessionServer);

    auto transport = std::make_shared<SimulatedSseTransport>(
        io.get_executor(), HttpTransportConfig { .url = server.url() }, "remote", SimulatedCatalog::github(), 10ms);
    auto client = McpClient(io.get_executor(), transport, "remote", 2s);

    REQUIRE(test::runAsync(io, client.connect()).has_value());
    CHECK(client.capabilities().serverName == "http-server");
    test::runUntilDone(io, client.close());
}

TEST_CASE("SimulatedCatalog github lists the hosted tools", "[http]")
{
    auto const catalog = SimulatedCatalog::github();
    REQUIRE(catalog.tools.is_array());
    CHECK(!catalog.tools.empty());
    auto const names = [&] {
        auto result = std::vector<std::string> {};
        for (const auto& tool: catalog.tools)
            result.push_back(tool["name"].get<std::string>());
        return result;
    }();
    CHECK(std::ranges::find(names, "search_repositories") != names.end());
    CHECK(std::ranges::find(names, "create_issue") != names.end());
}

TEST_CASE("PollingTransport collects queued replies with GET polls", "[http]")
{
    auto io = asio::io_context {};
    auto queued = std::deque<nlohmann::json> {};
    auto server = TestHttpServer(io, [&queued](const TestHttpServer::Request& request) {
        if (request.method == "GET")
        {
            auto body = std::string {};
            for (const auto& message: queued)
                body += message.dump() + "\n";
            queued.clear();
            return TestHttpServer::Reply { .contentType = "application/x-ndjson", .body = body };
        }

        if (auto reply = test::answerMcpRequest(nlohmann::json::parse(request.body, nullptr, false), "polled-server"))
            queued.push_back(std::move(*reply));
        return TestHttpServer::Reply { .status = 202, .contentType = "" };
    });

    auto transport = std::make_shared<PollingTransport>(
        io.get_executor(), HttpTransportConfig { .url = server.url() }, "remote", 20ms, 5s);
    auto client = McpClient(io.get_executor(), transport, "remote", 2s);

    REQUIRE(test::runAsync(io, client.connect()).has_value());
    CHECK(client.capabilities().serverName == "polled-server");

    auto const echoed = test::runAsync(io, client.callTool("echo", nlohmann::json { { "text", "polled" } }));
    REQUIRE(echoed.has_value());
    CHECK((*echoed)["content"][0]["text"] == "polled");
    CHECK(transport->outstandingCount() == 0);

    auto const& requests = server.requests();
    auto const polls = std::ranges::count_if(requests, [](const auto& r) { return r.method == "GET"; });
    CHECK(polls >= 2);
    for (const auto& request: requests)
    {
        if (request.method == "GET")
            CHECK(request.header("x-mcp-poll") == "true");
    }

    test::runUntilDone(io, client.close());
}

TEST_CASE("PollingTransport expires requests that are never answered", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, [](const TestHttpServer::Request& request) {
        if (request.method == "GET")
            return TestHttpServer::Reply { .body = "" };
        return TestHttpServer::Reply { .status = 202, .contentType = "" };
    });

    auto transport = std::make_shared<PollingTransport>(
        io.get_executor(), HttpTransportConfig { .url = server.url() }, "remote", 20ms, 100ms);
    auto errors = std::vector<Error> {};
    transport->setEvents(TransportEvents {
        .onMessage = {},
        .onError = [&](const Error& error) { errors.push_back(error); },
        .onClose = {},
    });

    REQUIRE(test::runAsync(io, transport->start()).has_value());
    REQUIRE(test::runAsync(io, transport->send(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 42 }, { "method", "ping" } }))
                .has_value());
    CHECK(transport->outstandingCount() == 1);

    REQUIRE(test::waitUntil(io, [&] { return !errors.empty(); }));
    CHECK(errors.front().code == ErrorCode::TimeoutError);
    CHECK(errors.front().message == "Request 42 timed out");
    CHECK(transport->outstandingCount() == 0);

    test::runUntilDone(io, transport->close());
}

TEST_CASE("httpFallbackChain orders transports per host", "[http]")
{
    CHECK(requiresSimulatedSse("https://api.githubcopilot.com/mcp/"));
    CHECK(requiresSimulatedSse("https://githubcopilot.com/mcp"));
    CHECK(!requiresSimulatedSse("https://githubcopilot.com.example.org/mcp"));
    CHECK(!requiresSimulatedSse("https://notgithubcopilot.com/mcp"));
    CHECK(!requiresSimulatedSse("not a url"));

    CHECK(httpFallbackChain("https://api.githubcopilot.com/mcp/")
          == std::vector<TransportProtocol> { TransportProtocol::SimulatedSse });
    CHECK(httpFallbackChain("http://localhost:3000/mcp")
          == std::vector<TransportProtocol> {
              TransportProtocol::StreamableHttp,
              TransportProtocol::SimulatedSse,
              TransportProtocol::Polling,
          });
}

TEST_CASE("connectServer prefers streamable HTTP", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, sessionServer);

    auto const client = test::runAsync(io, connectServer(io.get_executor(), "remote", httpConfig(server.url()), quickOptions()));
    REQUIRE(client.has_value());
    CHECK((*client)->protocol() == TransportProtocol::StreamableHttp);
    test::runUntilDone(io, (*client)->close());
}

TEST_CASE("connectServer falls back to simulated SSE for empty responses", "[http]")
{
    auto io = asio::io_context {};
    auto server = TestHttpServer(io, silentServer);

    auto const client = test::runAsync(io, connectServer(io.get_executor(), "remote", httpConfig(server.url()), quickOptions()));
    REQUIRE(client.has_value());
    CHECK((*client)->protocol() == TransportProtocol::SimulatedSse);

    auto const tools = test::runAsync(io, (*client)->listTools());
    REQUIRE(tools.has_value());
    CHECK(!tools->empty());
    test::runUntilDone(io, (*client)->close());
}

TEST_CASE("connectServer reports every failed attempt", "[http]")
{
    auto io = asio::io_context {};

    // Nothing listens on the discard port of the loopback interface.
    auto const client = test::runAsync(
        io, connectServer(io.get_executor(), "remote", httpConfig("http://127.0.0.1:9/mcp"), quickOptions()));
    REQUIRE(!client.has_value());
    CHECK(client.error().code == ErrorCode::TransportError);

    auto const& message = client.error().message;
    CHECK(message.starts_with("All transports failed for 'remote': "));
    CHECK(message.find("streamable-http: ") != std::string::npos);
    CHECK(message.find("sse-simulated: ") != std::string::npos);
    CHECK(message.find("polling: ") != std::string::npos);
}
