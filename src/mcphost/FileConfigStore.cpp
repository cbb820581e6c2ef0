// SPDX-License-Identifier: Apache-2.0
#include "FileConfigStore.hpp"

#include <core/Log.hpp>
#include <mcphost/Config.hpp>

#include <filesystem>
#include <format>

namespace mcphost
{

namespace
{

    auto readConfig(const std::string& path) -> Result<AppConfig>
    {
        if (!std::filesystem::exists(path))
            return AppConfig {};
        return loadConfigFromFile(path);
    }

} // namespace

FileConfigStore::FileConfigStore(std::string path): _path(std::move(path))
{
}

auto FileConfigStore::listAll() -> Result<std::vector<ServerConfig>>
{
    auto lock = std::lock_guard(_mutex);
    return readConfig(_path).transform([](AppConfig config) {
        auto servers = std::vector<ServerConfig> {};
        servers.reserve(config.mcpServers.size());
        for (auto& [name, server]: config.mcpServers)
            servers.push_back(std::move(server));
        return servers;
    });
}

auto FileConfigStore::find(std::string_view name) -> Result<ServerConfig>
{
    auto lock = std::lock_guard(_mutex);
    auto config = readConfig(_path);
    if (!config)
        return std::unexpected(config.error());

    auto const it = config->mcpServers.find(std::string(name));
    if (it == config->mcpServers.end())
        return makeError(ErrorCode::ConfigError, std::format("Unknown MCP server: {}", name));
    return it->second;
}

auto FileConfigStore::upsert(const ServerConfig& server) -> VoidResult
{
    if (server.name.empty())
        return makeError(ErrorCode::ConfigError, "Server name must not be empty");

    auto lock = std::lock_guard(_mutex);
    auto config = readConfig(_path);
    if (!config)
        return std::unexpected(config.error());

    config->mcpServers.insert_or_assign(server.name, server);
    log::debug("Saving MCP server '{}' to {}", server.name, _path);
    return saveConfigToFile(_path, *config);
}

auto FileConfigStore::remove(std::string_view name) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto config = readConfig(_path);
    if (!config)
        return std::unexpected(config.error());

    if (config->mcpServers.erase(std::string(name)) == 0)
        return makeError(ErrorCode::ConfigError, std::format("Unknown MCP server: {}", name));

    log::debug("Removing MCP server '{}' from {}", name, _path);
    return saveConfigToFile(_path, *config);
}

} // namespace mcphost
