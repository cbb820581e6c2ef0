// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/LifecycleManager.hpp>
#include <mcp/ServerConfig.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>

namespace mcphost
{

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;
    LifecycleTimeouts lifecycle;
    std::map<std::string, ServerConfig> mcpServers;
};

/// @brief Reads one entry of the "mcpServers" section.
///
/// `timeout` and `sseReadTimeout` are given in (fractional) seconds.
[[nodiscard]] auto serverConfigFromJson(std::string_view name, const nlohmann::json& entry) -> ServerConfig;

/// @brief Inverse of serverConfigFromJson(); the name is the key of the entry and not written.
[[nodiscard]] auto serverConfigToJson(const ServerConfig& config) -> nlohmann::json;

/// @brief Reads a whole configuration document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, or defaults if no file exists.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns $XDG_CONFIG_HOME/mcphost, or ~/.config/mcphost.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcphost
