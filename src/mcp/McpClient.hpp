// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP protocol exchange over a transport: connect + initialize,
/// list tools, call tools, close. Not thread-safe.
class McpClient
{
  public:
    /// @brief Protocol revision announced in the initialize request.
    static constexpr auto ProtocolVersion = std::string_view { "2025-03-26" };

    /// @brief Constructs a client speaking over @p transport, which must not be started yet
    ///        when open() is used.
    /// @param transport The transport the client takes ownership of.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Starts the transport and performs the initialize handshake.
    /// @return The server's capabilities, or the first transport or protocol error.
    [[nodiscard]] auto open() -> Result<McpServerCapabilities>;

    /// @brief Performs the MCP initialize handshake on an already started transport.
    [[nodiscard]] auto initialize() -> Result<McpServerCapabilities>;

    /// @brief Lists the server's tools, following pagination cursors to the last page.
    /// @return All tool definitions, or ProtocolError for a reply that is not a tool list.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Invokes a tool.
    /// @param name The tool name as the server knows it.
    /// @param arguments The tool arguments, passed through unchanged.
    /// @return The concatenated text content and the server's error flag. A failing tool is
    ///         a successful result with isError set; errors are reserved for the exchange itself.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    /// @brief Sends a ping request and waits for the (empty) reply.
    [[nodiscard]] auto ping() -> VoidResult;

    /// @brief Closes the underlying transport. Idempotent.
    void close();

    /// @brief Returns what the server reported during the handshake.
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitResponse(int64_t id) -> Result<nlohmann::json>;
    void answerServerRequest(const nlohmann::json& request);
};

} // namespace mcphost
