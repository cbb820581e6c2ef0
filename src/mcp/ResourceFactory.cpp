// SPDX-License-Identifier: Apache-2.0
#include "ResourceFactory.hpp"

#include <mcp/HttpTransport.hpp>
#include <mcp/McpSession.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcphost
{

auto validateServerConfig(const ServerConfig& config) -> VoidResult
{
    if (config.name.empty())
        return makeError(ErrorCode::ConfigError, "Server name must not be empty");

    if (config.timeout.count() <= 0)
        return makeError(ErrorCode::ConfigError, std::format("Server '{}': timeout must be positive", config.name));

    switch (config.kind)
    {
        case ServerKind::Stdio:
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': stdio servers need a command", config.name));
            return {};

        case ServerKind::StreamableHttp:
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server '{}': streamable HTTP servers need a URL", config.name));
            return parseReachableHttpUrl(config.command)
                .transform([](const HttpUrl&) {})
                .transform_error([&config](Error error) {
                    error.message = std::format("Server '{}': {}", config.name, error.message);
                    return error;
                });

        case ServerKind::Unknown: break;
    }

    return makeError(ErrorCode::ConfigError, std::format("Server '{}': unsupported server type", config.name));
}

auto buildResource(const ServerConfig& config) -> Result<std::shared_ptr<McpResource>>
{
    auto valid = validateServerConfig(config);
    if (!valid)
        return std::unexpected(valid.error());

    auto transport = std::unique_ptr<Transport> {};
    if (config.kind == ServerKind::Stdio)
    {
        transport = std::make_unique<StdioTransport>(StdioTransportConfig {
            .command = config.command,
            .args = config.args,
            .env = config.env,
            .cwd = config.cwd,
            .timeout = config.timeout,
        });
    }
    else
    {
        transport = std::make_unique<HttpTransport>(HttpTransportConfig {
            .url = config.command,
            .headers = config.headers,
            .timeout = config.timeout,
            .readTimeout = config.readTimeout,
        });
    }

    return std::make_shared<McpSession>(config, std::move(transport));
}

} // namespace mcphost
