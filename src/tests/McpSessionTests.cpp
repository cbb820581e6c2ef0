// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpSession.hpp>

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <queue>

using namespace mcphost;

namespace
{

/// @brief Transport that answers requests from a method -> result table.
class TableTransport: public Transport
{
  public:
    std::map<std::string, nlohmann::json> results;
    std::vector<nlohmann::json> sent;
    bool started = false;
    int closeCount = 0;

    auto start() -> VoidResult override
    {
        started = true;
        return {};
    }

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        sent.push_back(message);
        if (!message.contains("id"))
            return {};

        auto const it = results.find(message["method"].get<std::string>());
        if (it == results.end())
            _queue.push({ { "jsonrpc", "2.0" },
                          { "id", message["id"] },
                          { "error", { { "code", -32601 }, { "message", "Method not found" } } } });
        else
            _queue.push({ { "jsonrpc", "2.0" }, { "id", message["id"] }, { "result", it->second } });
        return {};
    }

    auto receive() -> Result<nlohmann::json> override
    {
        if (_queue.empty())
            return makeError(ErrorCode::TimeoutError, "nothing to receive");
        auto message = _queue.front();
        _queue.pop();
        return message;
    }

    void close() override
    {
        started = false;
        ++closeCount;
    }

    auto isConnected() const -> bool override { return started; }

  private:
    std::queue<nlohmann::json> _queue;
};

auto searchServer(std::string prefix) -> ServerConfig
{
    return ServerConfig { .name = "search", .command = "search-server", .toolPrefix = std::move(prefix) };
}

auto makeTransport() -> std::unique_ptr<TableTransport>
{
    auto transport = std::make_unique<TableTransport>();
    transport->results["initialize"] = {
        { "protocolVersion", "2025-03-26" },
        { "serverInfo", { { "name", "search" }, { "version", "3.0" } } },
        { "capabilities", { { "tools", nlohmann::json::object() } } },
    };
    transport->results["tools/list"] = { { "tools", nlohmann::json::array({ { { "name", "query" } } }) } };
    transport->results["tools/call"] = {
        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "42 results" } } }) },
    };
    return transport;
}

} // namespace

TEST_CASE("McpSession refuses requests until opened", "[session]")
{
    auto session = McpSession(searchServer(""), makeTransport());
    CHECK(!session.isOpen());
    CHECK(session.serverName() == "search");

    auto tools = session.listTools();
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::TransportError);
}

TEST_CASE("McpSession open and close pair up", "[session]")
{
    auto transport = makeTransport();
    auto* table = transport.get();
    auto session = McpSession(searchServer(""), std::move(transport));

    REQUIRE(session.open().has_value());
    CHECK(session.isOpen());
    CHECK(table->started);
    CHECK(session.capabilities().serverVersion == "3.0");

    session.close();
    session.close();
    CHECK(!session.isOpen());
    CHECK(!table->started);
}

TEST_CASE("McpSession prefixes tool names", "[session]")
{
    auto transport = makeTransport();
    auto* table = transport.get();
    auto session = McpSession(searchServer("web_"), std::move(transport));
    REQUIRE(session.open().has_value());

    auto tools = session.listTools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "web_query");

    auto result = session.callTool("web_query", { { "q", "mcp" } });
    REQUIRE(result.has_value());
    CHECK(result->content == "42 results");
    CHECK(table->sent.back()["params"]["name"] == "query");

    auto foreign = session.callTool("query", nlohmann::json::object());
    REQUIRE(!foreign.has_value());
    CHECK(foreign.error().code == ErrorCode::ToolCallError);
}

TEST_CASE("McpSession reports handshake failures with the server name", "[session]")
{
    auto transport = makeTransport();
    transport->results.erase("initialize");
    auto* table = transport.get();
    auto session = McpSession(searchServer(""), std::move(transport));

    auto opened = session.open();
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::ProtocolError);
    CHECK(opened.error().message.find("search") != std::string::npos);
    CHECK(!session.isOpen());
    CHECK(table->closeCount >= 1);
}
