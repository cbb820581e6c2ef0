// SPDX-License-Identifier: Apache-2.0
#include "ServerValidator.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>

namespace mcphost
{

namespace
{

    void closeQuietly(McpResource& resource)
    {
        try
        {
            resource.close();
        }
        catch (const std::exception& e)
        {
            log::warning("Error while closing MCP server '{}' after validation: {}", resource.serverName(), e.what());
        }
    }

} // namespace

auto validateServer(const ServerConfig& config, const ResourceFactory& factory) -> Result<std::vector<ToolDefinition>>
{
    log::info("Validating MCP server: {}", config);

    auto resource = factory(config);
    if (!resource)
        return std::unexpected(resource.error());
    if (!*resource)
        return makeError(ErrorCode::ConfigError, std::format("No resource could be built for '{}'", config.name));

    auto& server = **resource;
    auto tools = Result<std::vector<ToolDefinition>> {};
    try
    {
        auto opened = server.open();
        if (opened)
            tools = server.listTools();
        else
            tools = std::unexpected(opened.error());
    }
    catch (const std::exception& e)
    {
        tools = makeError(ErrorCode::TransportError, std::format("Unexpected error: {}", e.what()));
    }
    closeQuietly(server);

    if (!tools)
    {
        log::warning("Validation of MCP server '{}' failed: {}", config.name, tools.error());
        return tools;
    }

    log::info("MCP server '{}' is valid and offers {} tools", config.name, tools->size());
    return tools;
}

} // namespace mcphost
