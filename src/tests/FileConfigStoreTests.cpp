// SPDX-License-Identifier: Apache-2.0
#include <mcp/ResourceFactory.hpp>
#include <mcphost/Bootstrap.hpp>
#include <mcphost/Config.hpp>
#include <mcphost/FileConfigStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

#include <stdlib.h>

using namespace mcphost;
using namespace std::chrono_literals;

namespace
{

struct TempDir
{
    std::filesystem::path path;

    explicit TempDir(std::string_view name): path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(path, ec);
    }

    [[nodiscard]] auto file(std::string_view name) const -> std::string { return (path / name).string(); }
};

auto names(const std::vector<ServerConfig>& servers) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (const auto& server: servers)
        result.push_back(server.name);
    std::ranges::sort(result);
    return result;
}

} // namespace

TEST_CASE("FileConfigStore treats a missing file as empty", "[store]")
{
    auto const dir = TempDir("mcphost_test_store_missing");
    auto store = FileConfigStore(dir.file("config.json"));

    auto all = store.listAll();
    REQUIRE(all.has_value());
    CHECK(all->empty());

    auto found = store.find("search");
    REQUIRE(!found.has_value());
    CHECK(found.error().code == ErrorCode::ConfigError);
}

TEST_CASE("FileConfigStore upserts, lists and removes servers", "[store]")
{
    auto const dir = TempDir("mcphost_test_store_crud");
    auto store = FileConfigStore(dir.file("config.json"));

    REQUIRE(store.upsert(ServerConfig { .name = "search", .command = "python" }).has_value());
    REQUIRE(store.upsert(ServerConfig { .name = "files", .command = "fs-server", .enabled = false }).has_value());
    REQUIRE(store.upsert(ServerConfig { .name = "search", .command = "python3", .timeout = 2s }).has_value());

    auto all = store.listAll();
    REQUIRE(all.has_value());
    CHECK(names(*all) == std::vector<std::string> { "files", "search" });

    auto enabled = store.listEnabled();
    REQUIRE(enabled.has_value());
    CHECK(names(*enabled) == std::vector<std::string> { "search" });

    auto search = store.find("search");
    REQUIRE(search.has_value());
    CHECK(search->command == "python3");
    CHECK(search->timeout == 2s);

    REQUIRE(store.remove("files").has_value());
    CHECK(!store.remove("files").has_value());
    CHECK(store.listAll()->size() == 1);

    CHECK(!store.upsert(ServerConfig { .name = "", .command = "x" }).has_value());
}

TEST_CASE("FileConfigStore picks up external edits", "[store]")
{
    auto const dir = TempDir("mcphost_test_store_edits");
    auto const path = dir.file("config.json");
    auto store = FileConfigStore(path);

    {
        auto file = std::ofstream(path);
        file << R"({ "mcpServers": { "search": { "command": "python" } } })";
    }
    CHECK(store.listAll()->size() == 1);

    {
        auto file = std::ofstream(path);
        file << R"({ "mcpServers": { "search": { "command": "python" }, "files": { "command": "fs" } } })";
    }
    CHECK(store.listAll()->size() == 2);

    {
        auto file = std::ofstream(path);
        file << "garbage";
    }
    auto broken = store.listAll();
    REQUIRE(!broken.has_value());
    CHECK(broken.error().code == ErrorCode::ConfigError);
}

TEST_CASE("FileConfigStore keeps the other config sections", "[store]")
{
    auto const dir = TempDir("mcphost_test_store_sections");
    auto const path = dir.file("config.json");
    {
        auto file = std::ofstream(path);
        file << R"({ "logLevel": "debug", "lifecycle": { "graceTimeoutMs": 500 } })";
    }

    auto store = FileConfigStore(path);
    REQUIRE(store.upsert(ServerConfig { .name = "search", .command = "python" }).has_value());

    auto config = loadConfigFromFile(path);
    REQUIRE(config.has_value());
    CHECK(config->logLevel == log::Level::Debug);
    CHECK(config->lifecycle.grace == 500ms);
    CHECK(config->mcpServers.contains("search"));
}

TEST_CASE("defaultServers ships an enabled gateway and a disabled search server", "[bootstrap]")
{
    ::unsetenv("TAVILY_SEARCH_API_KEY");
    auto const servers = defaultServers();
    REQUIRE(servers.size() == 2);

    auto const gateway =
        std::ranges::find_if(servers, [](const ServerConfig& server) { return server.name == "docker-mcp-gateway"; });
    REQUIRE(gateway != servers.end());
    CHECK(gateway->enabled);
    CHECK(gateway->command == "docker");

    auto const tavily =
        std::ranges::find_if(servers, [](const ServerConfig& server) { return server.name == "tavily-search"; });
    REQUIRE(tavily != servers.end());
    CHECK(!tavily->enabled);
    CHECK(tavily->env.empty());

    for (const auto& server: servers)
        CHECK(validateServerConfig(server).has_value());
}

TEST_CASE("defaultServers hands the search API key to the search server", "[bootstrap]")
{
    ::setenv("TAVILY_SEARCH_API_KEY", "tvly-secret", 1);
    auto const servers = defaultServers();
    ::unsetenv("TAVILY_SEARCH_API_KEY");

    auto const tavily =
        std::ranges::find_if(servers, [](const ServerConfig& server) { return server.name == "tavily-search"; });
    REQUIRE(tavily != servers.end());
    REQUIRE(tavily->env.contains("TAVILY_API_KEY"));
    CHECK(tavily->env.at("TAVILY_API_KEY") == "tvly-secret");
}

TEST_CASE("seeded config files are readable by their owner only", "[bootstrap]")
{
    auto const temp = TempDir("mcphost_test_seed_permissions");
    auto store = FileConfigStore(temp.file("config.json"));
    REQUIRE(seedDefaultServers(store).has_value());

    auto const perms = std::filesystem::status(store.path()).permissions();
    auto const foreign = std::filesystem::perms::group_all | std::filesystem::perms::others_all;
    CHECK((perms & foreign) == std::filesystem::perms::none);
    CHECK((perms & std::filesystem::perms::owner_read) != std::filesystem::perms::none);
}

TEST_CASE("seedDefaultServers only seeds an empty store", "[bootstrap]")
{
    auto const dir = TempDir("mcphost_test_seed");
    auto store = FileConfigStore(dir.file("config.json"));

    auto seeded = seedDefaultServers(store);
    REQUIRE(seeded.has_value());
    CHECK(*seeded == 2);
    CHECK(store.listAll()->size() == 2);

    REQUIRE(store.remove("tavily-search").has_value());
    auto again = seedDefaultServers(store);
    REQUIRE(again.has_value());
    CHECK(*again == 0);
    CHECK(store.listAll()->size() == 1);
}

TEST_CASE("bootstrap starts the enabled servers of a store", "[bootstrap]")
{
    auto const dir = TempDir("mcphost_test_bootstrap");
    auto store = FileConfigStore(dir.file("config.json"));

    // A server that cannot be spawned; bootstrap must report rather than throw.
    REQUIRE(store.upsert(ServerConfig { .name = "ghost", .command = "/nonexistent/mcp-server", .timeout = 500ms })
                .has_value());
    REQUIRE(store.upsert(ServerConfig { .name = "idle", .command = "python", .enabled = false }).has_value());

    auto manager = LifecycleManager(LifecycleTimeouts { .init = 2s, .stop = 2s, .shutdown = 2s, .grace = 500ms });
    auto summary = bootstrap(manager, store);

    REQUIRE(summary.has_value());
    CHECK(summary->total == 1);
    CHECK(summary->started == 0);
    CHECK(summary->failed == std::vector<std::string> { "ghost" });
    CHECK(manager.trackedCount() == 0);
    CHECK(store.listAll()->size() == 2);
}
