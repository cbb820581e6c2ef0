// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace mcphost
{

/// @brief Text output of a tool call; `isError` marks a tool-level failure.
struct ToolResult
{
    std::string content;
    bool isError = false;
};

/// @brief Defines a tool that an MCP server exposes.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

} // namespace mcphost
