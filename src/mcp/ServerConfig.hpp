// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief How a server is reached.
enum class ServerKind : std::uint8_t
{
    Stdio,
    StreamableHttp,
    Unknown, ///< Unrecognized kind read from configuration; never buildable.
};

[[nodiscard]] constexpr auto serverKindToString(ServerKind kind) -> std::string_view
{
    switch (kind)
    {
        case ServerKind::Stdio: return "stdio";
        case ServerKind::StreamableHttp: return "streamable_http";
        case ServerKind::Unknown: return "unknown";
    }
    return "unknown";
}

/// @brief Parses a kind name; unrecognized names map to ServerKind::Unknown.
[[nodiscard]] constexpr auto serverKindFromString(std::string_view str) -> ServerKind
{
    if (str == "stdio")
        return ServerKind::Stdio;
    if (str == "streamable_http" || str == "streamable-http" || str == "http")
        return ServerKind::StreamableHttp;
    return ServerKind::Unknown;
}

/// @brief Immutable description of how to reach one MCP server.
struct ServerConfig
{
    /// @brief Unique key of the server.
    std::string name;
    ServerKind kind = ServerKind::Stdio;

    /// @brief Command to execute (stdio) or endpoint URL (streamable HTTP).
    std::string command;
    std::vector<std::string> args;

    /// @brief Extra environment of a stdio server. Values may be secrets and are never logged.
    std::map<std::string, std::string> env;

    /// @brief Per-request timeout.
    std::chrono::milliseconds timeout { 5000 };
    bool enabled = true;

    /// @brief Prefix prepended to every tool name exposed by this server.
    std::string toolPrefix;

    /// @brief Working directory of a stdio server (empty = inherit).
    std::string cwd;

    /// @brief Extra HTTP headers sent to a streamable HTTP server.
    std::map<std::string, std::string> headers;

    /// @brief Maximum wait for a streamed HTTP response body.
    std::chrono::milliseconds readTimeout { 300000 };

    auto operator==(const ServerConfig&) const -> bool = default;
};

} // namespace mcphost

/// Formats a config for log output; env values and header values are masked.
template <>
struct std::formatter<mcphost::ServerConfig>: std::formatter<std::string>
{
    auto format(const mcphost::ServerConfig& config, auto& ctx) const
    {
        auto text = std::format("{} ({}: {}", config.name, mcphost::serverKindToString(config.kind), config.command);
        for (const auto& arg: config.args)
            text += std::format(" {}", arg);
        for (const auto& [key, value]: config.env)
            text += std::format(", {}=***", key);
        for (const auto& [key, value]: config.headers)
            text += std::format(", {}: ***", key);
        text += ")";
        return std::formatter<std::string>::format(text, ctx);
    }
};
