// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpTransport.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <atomic>
#include <format>
#include <thread>

using namespace mcphost;

namespace
{

/// @brief Minimal streamable HTTP MCP endpoint on a loopback port.
class LoopbackMcpServer
{
  public:
    std::atomic<int> deleteCount = 0;
    std::atomic<int> unauthorized = 0;

    LoopbackMcpServer()
    {
        _server.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Authorization") != "Bearer token")
            {
                ++unauthorized;
                res.status = 401;
                return;
            }

            auto const message = nlohmann::json::parse(req.body);
            if (!message.contains("id"))
            {
                res.status = 202;
                return;
            }

            auto const method = message["method"].get<std::string>();
            if (method == "initialize")
            {
                res.set_header("Mcp-Session-Id", "session-42");
                auto reply = nlohmann::json {
                    { "jsonrpc", "2.0" },
                    { "id", message["id"] },
                    { "result",
                      {
                          { "protocolVersion", "2025-03-26" },
                          { "serverInfo", { { "name", "loopback" }, { "version", "1.0" } } },
                          { "capabilities", { { "tools", nlohmann::json::object() } } },
                      } },
                };
                res.set_content(reply.dump(), "application/json");
                return;
            }

            if (req.get_header_value("Mcp-Session-Id") != "session-42")
            {
                res.status = 400;
                return;
            }

            // Answer everything else as an event stream, preceded by a progress notification.
            auto const progress = jsonrpc::makeNotification("notifications/progress", { { "progress", 1 } });
            auto const reply = nlohmann::json {
                { "jsonrpc", "2.0" },
                { "id", message["id"] },
                { "result", { { "tools", nlohmann::json::array({ { { "name", "echo" } } }) } } },
            };
            res.set_content(std::format("event: message\ndata: {}\n\ndata: {}\n\n", progress.dump(), reply.dump()),
                            "text/event-stream");
        });

        _server.Delete("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Mcp-Session-Id") == "session-42")
                ++deleteCount;
            res.status = 200;
        });

        _port = _server.bind_to_any_port("127.0.0.1");
        _thread = std::jthread([this] { _server.listen_after_bind(); });
        _server.wait_until_ready();
    }

    ~LoopbackMcpServer()
    {
        _server.stop();
    }

    [[nodiscard]] auto url() const -> std::string { return std::format("http://127.0.0.1:{}/mcp", _port); }

  private:
    httplib::Server _server;
    int _port = 0;
    std::jthread _thread;
};

} // namespace

TEST_CASE("parseHttpUrl splits origin and path", "[http]")
{
    auto url = parseHttpUrl("https://example.com:8443/api/mcp?x=1");
    REQUIRE(url.has_value());
    CHECK(url->origin == "https://example.com:8443");
    CHECK(url->path == "/api/mcp?x=1");
    CHECK(url->secure);

    auto bare = parseHttpUrl("http://localhost");
    REQUIRE(bare.has_value());
    CHECK(bare->origin == "http://localhost");
    CHECK(bare->path == "/");
    CHECK(!bare->secure);
}

TEST_CASE("parseHttpUrl rejects unusable URLs", "[http]")
{
    for (auto const* text: { "localhost:8000/mcp", "ftp://example.com/mcp", "http:///mcp" })
    {
        auto url = parseHttpUrl(text);
        REQUIRE(!url.has_value());
        CHECK(url.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("parseEventStream collects data payloads", "[http]")
{
    auto const body = "event: message\r\n"
                      "data: {\"id\":1}\r\n"
                      "\r\n"
                      ": keep-alive comment\n"
                      "data: {\"id\":\n"
                      "data: 2}\n"
                      "\n"
                      "data: not json\n"
                      "\n"
                      "data: {\"id\":3}";

    auto messages = parseEventStream(body);
    REQUIRE(messages.size() == 3);
    CHECK(messages[0]["id"] == 1);
    CHECK(messages[1]["id"] == 2);
    CHECK(messages[2]["id"] == 3);
}

TEST_CASE("HttpTransport refuses to start with an invalid URL", "[http]")
{
    auto transport = HttpTransport(HttpTransportConfig { .url = "not a url" });
    auto started = transport.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::ConfigError);
    CHECK(!transport.isConnected());
}

TEST_CASE("HttpTransport refuses https without TLS support", "[http]")
{
    if (httpsSupported())
        SKIP("HTTP client built with TLS support");

    auto transport = HttpTransport(HttpTransportConfig { .url = "https://example.com/mcp" });
    auto started = transport.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::ConfigError);
    CHECK(!transport.isConnected());
}

TEST_CASE("HttpTransport reports unreachable endpoints on send", "[http]")
{
    // Port 9 (discard) on loopback is virtually never served.
    auto transport = HttpTransport(HttpTransportConfig {
        .url = "http://127.0.0.1:9/mcp",
        .timeout = std::chrono::milliseconds { 500 },
    });
    REQUIRE(transport.start().has_value());

    auto sent = transport.send(jsonrpc::makeRequest(1, "ping"));
    REQUIRE(!sent.has_value());
    CHECK(sent.error().code == ErrorCode::TransportError);
}

TEST_CASE("HttpTransport drives an MCP session over streamable HTTP", "[http]")
{
    auto server = LoopbackMcpServer {};

    auto transport = std::make_unique<HttpTransport>(HttpTransportConfig {
        .url = server.url(),
        .headers = { { "Authorization", "Bearer token" } },
    });
    auto* http = transport.get();

    auto client = McpClient(std::move(transport));
    auto caps = client.open();
    REQUIRE(caps.has_value());
    CHECK(caps->serverName == "loopback");
    CHECK(http->sessionId() == "session-42");

    auto tools = client.listTools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "echo");

    client.close();
    CHECK(!http->isConnected());
    CHECK(server.deleteCount == 1);
    CHECK(server.unauthorized == 0);
}

TEST_CASE("HttpTransport surfaces HTTP error statuses", "[http]")
{
    auto server = LoopbackMcpServer {};

    auto transport = HttpTransport(HttpTransportConfig { .url = server.url() });
    REQUIRE(transport.start().has_value());

    auto sent = transport.send(jsonrpc::makeRequest(1, "initialize"));
    REQUIRE(!sent.has_value());
    CHECK(sent.error().code == ErrorCode::TransportError);
    CHECK(server.unauthorized == 1);
}
