// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace mcphost
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport is not thread-safe; callers serialize access.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the connection (spawns the process, validates the endpoint, ...).
    /// @return ConfigError for unusable settings, TransportError if the server cannot be reached.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Sends a JSON message to the server.
    /// @param message A complete JSON-RPC message.
    /// @return TransportError if the message could not be delivered.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the server.
    ///
    /// Blocks for at most the transport's configured request timeout.
    /// @return The message, TimeoutError when nothing arrived in time, ProtocolError for
    ///         undecodable input, or TransportError once the connection is gone.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection. Idempotent.
    virtual void close() = 0;

    /// @brief Returns true between a successful start() and close() or a connection loss.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcphost
