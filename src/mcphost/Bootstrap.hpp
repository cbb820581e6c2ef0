// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/LifecycleManager.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcphost/FileConfigStore.hpp>

#include <vector>

namespace mcphost
{

/// @brief The server set a fresh installation starts out with.
///
/// `docker-mcp-gateway` bridges to a local Docker MCP gateway and is enabled;
/// `tavily-search` needs an API key (taken from $TAVILY_SEARCH_API_KEY) and is disabled.
[[nodiscard]] auto defaultServers() -> std::vector<ServerConfig>;

/// @brief Writes defaultServers() into the store if it holds no servers at all.
/// @return The number of servers seeded (0 if the store was not empty).
[[nodiscard]] auto seedDefaultServers(FileConfigStore& store) -> Result<size_t>;

/// @brief Seeds defaults into an empty store, then starts every enabled server.
[[nodiscard]] auto bootstrap(LifecycleManager& manager, FileConfigStore& store) -> Result<StartSummary>;

} // namespace mcphost
