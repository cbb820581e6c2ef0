// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphost::jsonrpc
{

namespace
{
    auto withParams(nlohmann::json msg, nlohmann::json params) -> nlohmann::json
    {
        if (!params.is_null())
            msg["params"] = std::move(params);
        return msg;
    }
} // namespace

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return withParams(
        nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "method", method },
        },
        std::move(params));
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return withParams(
        nlohmann::json {
            { "jsonrpc", "2.0" },
            { "method", method },
        },
        std::move(params));
}

auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto isIncomingCall(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method");
}

auto isResponseTo(const nlohmann::json& message, int64_t id) -> bool
{
    if (!message.is_object() || isIncomingCall(message) || !message.contains("id"))
        return false;

    auto const& msgId = message["id"];
    if (msgId.is_number_integer())
        return msgId.get<int64_t>() == id;
    // Some servers echo numeric ids back as strings.
    if (msgId.is_string())
        return msgId.get<std::string>() == std::to_string(id);
    return false;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has neither result nor error");
    }

    return response;
}

} // namespace mcphost::jsonrpc
