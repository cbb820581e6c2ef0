// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphost
{

namespace
{

    auto secondsToMillis(double seconds) -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(seconds * 1000.0)));
    }

    auto millisToSeconds(std::chrono::milliseconds ms) -> double
    {
        return static_cast<double>(ms.count()) / 1000.0;
    }

    auto toJsonObject(const std::map<std::string, std::string>& map) -> nlohmann::json
    {
        auto obj = nlohmann::json::object();
        for (const auto& [key, value]: map)
            obj[key] = value;
        return obj;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcphost";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphost";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto serverConfigFromJson(std::string_view name, const nlohmann::json& entry) -> ServerConfig
{
    auto const defaults = ServerConfig {};
    return ServerConfig {
        .name = std::string(name),
        .kind = serverKindFromString(json::getStringOr(entry, "type", "stdio")),
        .command = json::getStringOr(entry, "command", ""),
        .args = json::getStringArray(entry, "args"),
        .env = json::getStringMap(entry, "env"),
        .timeout = secondsToMillis(json::getDoubleOr(entry, "timeout", millisToSeconds(defaults.timeout))),
        .enabled = json::getBoolOr(entry, "enabled", true),
        .toolPrefix = json::getStringOr(entry, "toolPrefix", ""),
        .cwd = json::getStringOr(entry, "cwd", ""),
        .headers = json::getStringMap(entry, "headers"),
        .readTimeout =
            secondsToMillis(json::getDoubleOr(entry, "sseReadTimeout", millisToSeconds(defaults.readTimeout))),
    };
}

auto serverConfigToJson(const ServerConfig& config) -> nlohmann::json
{
    auto server = nlohmann::json::object();
    server["type"] = std::string(serverKindToString(config.kind));
    server["command"] = config.command;
    if (!config.args.empty())
        server["args"] = config.args;
    if (!config.env.empty())
        server["env"] = toJsonObject(config.env);
    server["timeout"] = millisToSeconds(config.timeout);
    server["enabled"] = config.enabled;
    if (!config.toolPrefix.empty())
        server["toolPrefix"] = config.toolPrefix;
    if (!config.cwd.empty())
        server["cwd"] = config.cwd;
    if (config.kind == ServerKind::StreamableHttp)
    {
        if (!config.headers.empty())
            server["headers"] = toJsonObject(config.headers);
        server["sseReadTimeout"] = millisToSeconds(config.readTimeout);
    }
    return server;
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    auto const levelStr = json::getStringOr(root, "logLevel", "info");
    auto const level = log::levelFromString(levelStr);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelStr));
    config.logLevel = *level;

    // Lifecycle section
    if (root.contains("lifecycle"))
    {
        auto const& lifecycle = root["lifecycle"];
        auto& timeouts = config.lifecycle;
        timeouts.init = std::chrono::milliseconds(
            json::getIntOr(lifecycle, "initTimeoutMs", static_cast<int>(timeouts.init.count())));
        timeouts.stop = std::chrono::milliseconds(
            json::getIntOr(lifecycle, "stopTimeoutMs", static_cast<int>(timeouts.stop.count())));
        timeouts.shutdown = std::chrono::milliseconds(
            json::getIntOr(lifecycle, "shutdownTimeoutMs", static_cast<int>(timeouts.shutdown.count())));
        timeouts.grace = std::chrono::milliseconds(
            json::getIntOr(lifecycle, "graceTimeoutMs", static_cast<int>(timeouts.grace.count())));

        if (timeouts.init.count() <= 0 || timeouts.stop.count() <= 0 || timeouts.shutdown.count() <= 0
            || timeouts.grace.count() < 0)
            return makeError(ErrorCode::ConfigError, "Lifecycle timeouts must be positive");
    }

    // MCP servers section
    if (root.contains("mcpServers"))
    {
        auto const& servers = root["mcpServers"];
        if (!servers.is_object())
            return makeError(ErrorCode::ConfigError, "\"mcpServers\" must be a JSON object");

        for (const auto& [name, serverJson]: servers.items())
        {
            if (!serverJson.is_object())
                return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be a JSON object", name));
            config.mcpServers[name] = serverConfigFromJson(name, serverJson);
        }
    }

    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["logLevel"] = std::string(log::levelToString(config.logLevel));

    auto lifecycle = nlohmann::json::object();
    lifecycle["initTimeoutMs"] = config.lifecycle.init.count();
    lifecycle["stopTimeoutMs"] = config.lifecycle.stop.count();
    lifecycle["shutdownTimeoutMs"] = config.lifecycle.shutdown.count();
    lifecycle["graceTimeoutMs"] = config.lifecycle.grace.count();
    root["lifecycle"] = std::move(lifecycle);

    auto servers = nlohmann::json::object();
    for (const auto& [name, serverConfig]: config.mcpServers)
        servers[name] = serverConfigToJson(serverConfig);
    root["mcpServers"] = std::move(servers);

    return root;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return configFromJson(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    // Server env entries may carry API keys.
    auto ec = std::error_code {};
    std::filesystem::permissions(std::filesystem::path(path),
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace,
                                 ec);
    if (ec)
        log::warning("Cannot restrict permissions of config file {}: {}", path, ec.message());

    file << configToJson(config).dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcphost
