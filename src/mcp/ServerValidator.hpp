// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ResourceFactory.hpp>
#include <mcp/ServerConfig.hpp>

#include <vector>

namespace mcphost
{

/// @brief Probes a server configuration without registering it anywhere.
///
/// Builds the resource, opens it, lists its tools and closes it again, all on the
/// calling thread. The resource is closed on every path once it was built.
/// @return The tools the server offers, or the reason it is unusable.
[[nodiscard]] auto validateServer(const ServerConfig& config, const ResourceFactory& factory = buildResource)
    -> Result<std::vector<ToolDefinition>>;

} // namespace mcphost
