// SPDX-License-Identifier: Apache-2.0
#include "McpSession.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcphost
{

McpSession::McpSession(ServerConfig config, std::unique_ptr<Transport> transport):
    _config(std::move(config)), _client(std::move(transport))
{
}

McpSession::~McpSession()
{
    close();
}

auto McpSession::open() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_open)
        return {};

    auto caps = _client.open();
    if (!caps)
    {
        _client.close();
        return makeError(caps.error().code,
                         std::format("Cannot connect to MCP server '{}': {}", _config.name, caps.error().message));
    }

    _open = true;
    log::info("MCP server '{}' connected: {} v{}", _config.name, caps->serverName, caps->serverVersion);
    return {};
}

void McpSession::close()
{
    auto lock = std::lock_guard(_mutex);
    if (!_open)
        return;

    _open = false;
    _client.close();
    log::debug("MCP server '{}' disconnected", _config.name);
}

auto McpSession::isOpen() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _open;
}

auto McpSession::serverName() const -> const std::string&
{
    return _config.name;
}

auto McpSession::listTools() -> Result<std::vector<ToolDefinition>>
{
    auto lock = std::lock_guard(_mutex);
    if (!_open)
        return makeError(ErrorCode::TransportError, std::format("MCP server '{}' is not connected", _config.name));

    auto tools = _client.listTools();
    if (tools && !_config.toolPrefix.empty())
    {
        for (auto& tool: *tools)
            tool.name = _config.toolPrefix + tool.name;
    }
    return tools;
}

auto McpSession::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto lock = std::lock_guard(_mutex);
    if (!_open)
        return makeError(ErrorCode::TransportError, std::format("MCP server '{}' is not connected", _config.name));

    if (!_config.toolPrefix.empty())
    {
        if (!name.starts_with(_config.toolPrefix))
            return makeError(ErrorCode::ToolCallError,
                             std::format("Tool '{}' does not belong to server '{}'", name, _config.name));
        name.remove_prefix(_config.toolPrefix.size());
    }

    return _client.callTool(name, arguments);
}

auto McpSession::capabilities() const -> McpServerCapabilities
{
    auto lock = std::lock_guard(_mutex);
    return _client.capabilities();
}

} // namespace mcphost
