// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/ServerValidator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace mcphost;

namespace
{

struct CapturedLine
{
    log::Level level;
    std::string text;
};

} // namespace

TEST_CASE("log levels parse and print", "[log]")
{
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("loud").has_value());
    CHECK(log::levelToString(log::Level::Debug) == "debug");
    CHECK(log::levelFromString(log::levelToString(log::Level::Error)) == log::Level::Error);
}

TEST_CASE("log drops messages above the configured level", "[log]")
{
    auto lines = std::vector<CapturedLine> {};
    {
        auto const capture = log::ScopedCapture(
            [&](log::Level level, std::string_view text) { lines.push_back({ level, std::string(text) }); },
            log::Level::Warning);

        log::error("disk {} is full", 1);
        log::warning("slow server");
        log::info("started");
        log::debug("details");
    }

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == log::Level::Error);
    CHECK(lines[0].text == "disk 1 is full");
    CHECK(lines[1].level == log::Level::Warning);
}

TEST_CASE("server secrets never reach the log", "[log]")
{
    auto lines = std::vector<CapturedLine> {};
    {
        auto const capture = log::ScopedCapture(
            [&](log::Level level, std::string_view text) { lines.push_back({ level, std::string(text) }); },
            log::Level::Trace);

        auto const config = ServerConfig {
            .name = "tavily",
            .command = "/nonexistent/mcp_server_tavily",
            .env = { { "TAVILY_API_KEY", "tvly-very-secret" } },
            .timeout = std::chrono::milliseconds { 500 },
        };
        CHECK(!validateServer(config).has_value());
    }

    REQUIRE(!lines.empty());
    auto masked = false;
    for (const auto& line: lines)
    {
        CHECK(line.text.find("tvly-very-secret") == std::string::npos);
        masked = masked || line.text.find("TAVILY_API_KEY=***") != std::string::npos;
    }
    CHECK(masked);
}
