// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpResource.hpp>
#include <mcp/ServerConfig.hpp>

#include <functional>
#include <memory>

namespace mcphost
{

/// @brief Turns a configuration into a not-yet-opened resource, or fails with ErrorCode::ConfigError.
using ResourceFactory = std::function<Result<std::shared_ptr<McpResource>>(const ServerConfig&)>;

/// @brief Checks that a configuration carries everything its kind needs.
[[nodiscard]] auto validateServerConfig(const ServerConfig& config) -> VoidResult;

/// @brief The default factory: stdio servers become an McpSession over a StdioTransport,
/// streamable HTTP servers an McpSession over an HttpTransport.
///
/// Pure: nothing is spawned or connected until the resource is opened.
[[nodiscard]] auto buildResource(const ServerConfig& config) -> Result<std::shared_ptr<McpResource>>;

} // namespace mcphost
