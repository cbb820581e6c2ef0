// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace mcphost
{

namespace
{
    /// Upper bound on unrelated messages (notifications, server requests) skipped while waiting.
    constexpr auto MaxSkippedMessages = 256;
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient()
{
    close();
}

auto McpClient::open() -> Result<McpServerCapabilities>
{
    return _transport->start().and_then([this]() { return initialize(); });
}

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcphost" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError, "initialize result is not an object");

            auto const serverInfo = json::getObjectOr(result, "serverInfo");
            _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
            _capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", ProtocolVersion);

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            auto sent = _transport->send(jsonrpc::makeNotification("notifications/initialized"));
            if (!sent)
                return std::unexpected(sent.error());

            _initialized = true;
            log::debug("MCP handshake done with {} v{} (protocol {})",
                       _capabilities.serverName,
                       _capabilities.serverVersion,
                       _capabilities.protocolVersion);

            return _capabilities;
        });
}

auto McpClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDefinition> {};
    auto cursor = std::string {};

    // tools/list is paginated; follow nextCursor until the server stops sending one.
    do
    {
        auto params = cursor.empty() ? nlohmann::json(nullptr) : nlohmann::json { { "cursor", cursor } };
        auto page = sendRequest("tools/list", std::move(params));
        if (!page)
            return std::unexpected(page.error());
        if (!page->is_object())
            return makeError(ErrorCode::ProtocolError, "tools/list result is not an object");

        if (page->contains("tools") && (*page)["tools"].is_array())
        {
            for (const auto& toolJson: (*page)["tools"])
            {
                if (!toolJson.is_object())
                {
                    log::debug("Skipping malformed tool entry: {}", toolJson.dump());
                    continue;
                }
                tools.push_back(ToolDefinition {
                    .name = json::getStringOr(toolJson, "name", ""),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = json::getObjectOr(toolJson, "inputSchema"),
                });
            }
        }

        auto next = json::getStringOr(*page, "nextCursor", "");
        if (next == cursor)
            break;
        cursor = std::move(next);
    } while (!cursor.empty());

    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params))
        .and_then([&name](const nlohmann::json& result) -> Result<ToolResult> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError,
                                 std::format("tools/call result for '{}' is not an object", name));

            auto toolResult = ToolResult {};
            toolResult.isError = json::getBoolOr(result, "isError", false);

            if (result.contains("content") && result["content"].is_array())
            {
                for (const auto& item: result["content"])
                {
                    if (json::getStringOr(item, "type", "") == "text")
                    {
                        if (!toolResult.content.empty())
                            toolResult.content += "\n";
                        toolResult.content += json::getStringOr(item, "text", "");
                    }
                }
            }

            log::trace("Tool '{}' returned: {} (isError: {})", name, toolResult.content, toolResult.isError);
            return toolResult;
        });
}

auto McpClient::ping() -> VoidResult
{
    return sendRequest("ping").transform([](const nlohmann::json&) {});
}

void McpClient::close()
{
    _initialized = false;
    if (_transport)
        _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->send(request)
        .and_then([this, id]() { return awaitResponse(id); })
        .and_then([](const nlohmann::json& msg) -> Result<nlohmann::json> {
            return jsonrpc::parseResponse(msg).and_then(
                [](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                    if (resp.error)
                    {
                        return makeError(
                            ErrorCode::ProtocolError,
                            std::format("RPC error {}: {}", resp.error->code, resp.error->message));
                    }
                    return resp.result.value_or(nlohmann::json::object());
                });
        });
}

void McpClient::answerServerRequest(const nlohmann::json& request)
{
    auto const& requestId = request["id"];
    auto const method = json::getStringOr(request, "method", "");

    // Only ping is answered; everything else is unsupported.
    auto reply = method == "ping"
                     ? jsonrpc::makeResponse(requestId, nlohmann::json::object())
                     : jsonrpc::makeErrorResponse(
                           requestId, jsonrpc::errors::MethodNotFound, std::format("Method not found: {}", method));

    if (auto sent = _transport->send(reply); !sent)
        log::warning("Failed to answer MCP server request '{}': {}", method, sent.error().message);
}

auto McpClient::awaitResponse(int64_t id) -> Result<nlohmann::json>
{
    for (auto skipped = 0; skipped < MaxSkippedMessages; ++skipped)
    {
        auto msg = _transport->receive();
        if (!msg)
            return msg;

        if (jsonrpc::isResponseTo(*msg, id))
            return msg;

        if (jsonrpc::isIncomingCall(*msg) && msg->contains("id"))
        {
            answerServerRequest(*msg);
            continue;
        }

        log::trace("Ignoring unrelated MCP message while waiting for response {}: {}", id, msg->dump());
    }

    return makeError(ErrorCode::ProtocolError, std::format("No response to request {}", id));
}

} // namespace mcphost
