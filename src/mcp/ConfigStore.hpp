// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>

#include <vector>

namespace mcphost
{

/// @brief Source of persisted server configurations.
class ConfigStore
{
  public:
    virtual ~ConfigStore() = default;

    /// @brief Returns every configured server, enabled or not.
    [[nodiscard]] virtual auto listAll() -> Result<std::vector<ServerConfig>> = 0;

    /// @brief Returns the servers that should be running.
    [[nodiscard]] virtual auto listEnabled() -> Result<std::vector<ServerConfig>>
    {
        return listAll().transform([](std::vector<ServerConfig> all) {
            std::erase_if(all, [](const ServerConfig& config) { return !config.enabled; });
            return all;
        });
    }
};

} // namespace mcphost
