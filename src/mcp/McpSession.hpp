// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/McpClient.hpp>
#include <mcp/McpResource.hpp>
#include <mcp/ServerConfig.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace mcphost
{

/// @brief McpResource backed by an McpClient over an arbitrary transport.
///
/// Requests are serialized by an internal mutex, so a published session can be shared
/// by concurrent consumers.
class McpSession: public McpResource
{
  public:
    McpSession(ServerConfig config, std::unique_ptr<Transport> transport);
    ~McpSession() override;

    [[nodiscard]] auto open() -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;
    [[nodiscard]] auto serverName() const -> const std::string& override;

    /// @brief Lists the server's tools, renamed with the configured tool prefix.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>> override;

    /// @brief Calls a tool by its (prefixed) name.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolResult> override;

    [[nodiscard]] auto config() const -> const ServerConfig& { return _config; }

    /// @brief Capabilities reported by the server (valid while open).
    [[nodiscard]] auto capabilities() const -> McpServerCapabilities;

  private:
    ServerConfig _config;
    mutable std::mutex _mutex;
    McpClient _client;
    bool _open = false;
};

} // namespace mcphost
