// SPDX-License-Identifier: Apache-2.0
#include "Bootstrap.hpp"

#include <core/Log.hpp>

#include <cstdlib>
#include <map>
#include <string>
#include <utility>

namespace mcphost
{

auto defaultServers() -> std::vector<ServerConfig>
{
    auto tavilyEnv = std::map<std::string, std::string> {};
    if (auto const* const tavilyKey = std::getenv("TAVILY_SEARCH_API_KEY"); tavilyKey && *tavilyKey)
        tavilyEnv.emplace("TAVILY_API_KEY", tavilyKey);

    return {
        ServerConfig {
            .name = "docker-mcp-gateway",
            .kind = ServerKind::Stdio,
            .command = "docker",
            .args = { "run", "-i", "--rm", "--name", "mcp-gateway", "alpine/socat", "STDIO",
                      "TCP:host.docker.internal:8811" },
            .enabled = true,
        },
        ServerConfig {
            .name = "tavily-search",
            .kind = ServerKind::Stdio,
            .command = "python",
            .args = { "-m", "mcp_server_tavily" },
            .env = std::move(tavilyEnv),
            .enabled = false,
        },
    };
}

auto seedDefaultServers(FileConfigStore& store) -> Result<size_t>
{
    auto existing = store.listAll();
    if (!existing)
        return std::unexpected(existing.error());
    if (!existing->empty())
        return size_t { 0 };

    log::info("No MCP servers configured in {}. Seeding defaults...", store.path());

    auto seeded = size_t { 0 };
    for (const auto& server: defaultServers())
    {
        if (auto result = store.upsert(server); !result)
        {
            log::error("Failed to create MCP server configuration '{}': {}", server.name, result.error());
            continue;
        }
        log::info("Created MCP server configuration: {}", server.name);
        ++seeded;
    }
    return seeded;
}

auto bootstrap(LifecycleManager& manager, FileConfigStore& store) -> Result<StartSummary>
{
    if (auto seeded = seedDefaultServers(store); !seeded)
        log::error("Failed to seed default MCP servers: {}", seeded.error());

    auto summary = manager.startEnabledServers(store);
    if (!summary)
    {
        log::error("Failed to start MCP servers: {}", summary.error());
        return summary;
    }

    for (const auto& name: summary->failed)
        log::warning("MCP server '{}' could not be started", name);
    return summary;
}

} // namespace mcphost
