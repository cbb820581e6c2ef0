// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief An openable, closable connection to one MCP server.
///
/// open() and close() are called by exactly one owner thread (the server's lifecycle
/// task), and always from that same thread. Once open, listTools() and callTool()
/// may be called concurrently from any thread; implementations serialize as needed.
class McpResource
{
  public:
    virtual ~McpResource() = default;

    /// @brief Connects to the server (spawn + handshake, or HTTP session setup).
    [[nodiscard]] virtual auto open() -> VoidResult = 0;

    /// @brief Disconnects and releases all OS resources. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /// @brief Name of the server this resource was built for.
    [[nodiscard]] virtual auto serverName() const -> const std::string& = 0;

    [[nodiscard]] virtual auto listTools() -> Result<std::vector<ToolDefinition>> = 0;

    [[nodiscard]] virtual auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolResult> = 0;
};

} // namespace mcphost
