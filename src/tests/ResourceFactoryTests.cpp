// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpTransport.hpp>
#include <mcp/McpSession.hpp>
#include <mcp/ResourceFactory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <format>

using namespace mcphost;
using namespace std::chrono_literals;

TEST_CASE("validateServerConfig accepts complete configs", "[factory]")
{
    CHECK(validateServerConfig(ServerConfig { .name = "search", .command = "python" }).has_value());
    CHECK(validateServerConfig(ServerConfig {
                                   .name = "remote",
                                   .kind = ServerKind::StreamableHttp,
                                   .command = "http://localhost:8000/mcp",
                               })
              .has_value());
}

TEST_CASE("validateServerConfig rejects incomplete configs", "[factory]")
{
    auto const rejects = [](const ServerConfig& config) {
        auto result = validateServerConfig(config);
        return !result.has_value() && result.error().code == ErrorCode::ConfigError;
    };

    CHECK(rejects(ServerConfig { .name = "", .command = "python" }));
    CHECK(rejects(ServerConfig { .name = "broken", .command = "" }));
    CHECK(rejects(ServerConfig { .name = "slow", .command = "python", .timeout = 0ms }));
    CHECK(rejects(ServerConfig { .name = "remote", .kind = ServerKind::StreamableHttp, .command = "" }));
    CHECK(rejects(ServerConfig { .name = "remote", .kind = ServerKind::StreamableHttp, .command = "ftp://x/mcp" }));
    CHECK(rejects(ServerConfig { .name = "odd", .kind = ServerKind::Unknown, .command = "python" }));
}

TEST_CASE("validateServerConfig accepts https only with TLS support", "[factory]")
{
    auto result = validateServerConfig(ServerConfig {
        .name = "remote",
        .kind = ServerKind::StreamableHttp,
        .command = "https://example.com/mcp",
    });

    if (httpsSupported())
    {
        CHECK(result.has_value());
    }
    else
    {
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.find("remote") != std::string::npos);
    }
}

TEST_CASE("buildResource is pure and returns an unopened session", "[factory]")
{
    auto const config = ServerConfig {
        .name = "search",
        .command = "/nonexistent/never-spawned",
        .toolPrefix = "s_",
    };

    auto resource = buildResource(config);
    REQUIRE(resource.has_value());
    REQUIRE(*resource != nullptr);
    CHECK((*resource)->serverName() == "search");
    CHECK(!(*resource)->isOpen());

    auto const* session = dynamic_cast<McpSession const*>(resource->get());
    REQUIRE(session != nullptr);
    CHECK(session->config() == config);
}

TEST_CASE("buildResource reports invalid configs", "[factory]")
{
    auto resource = buildResource(ServerConfig { .name = "broken", .command = "" });
    REQUIRE(!resource.has_value());
    CHECK(resource.error().code == ErrorCode::ConfigError);
}

TEST_CASE("ServerKind names round-trip", "[factory]")
{
    CHECK(serverKindFromString("stdio") == ServerKind::Stdio);
    CHECK(serverKindFromString("streamable_http") == ServerKind::StreamableHttp);
    CHECK(serverKindFromString("http") == ServerKind::StreamableHttp);
    CHECK(serverKindFromString("websocket") == ServerKind::Unknown);
    CHECK(serverKindToString(ServerKind::StreamableHttp) == "streamable_http");
}

TEST_CASE("ServerConfig formatting masks secrets", "[factory]")
{
    auto const config = ServerConfig {
        .name = "tavily",
        .command = "python",
        .args = { "-m", "mcp_server_tavily" },
        .env = { { "TAVILY_API_KEY", "super-secret" } },
    };

    auto const text = std::format("{}", config);
    CHECK(text.find("TAVILY_API_KEY=***") != std::string::npos);
    CHECK(text.find("super-secret") == std::string::npos);
    CHECK(text.find("mcp_server_tavily") != std::string::npos);
}
