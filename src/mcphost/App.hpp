// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcphost/Config.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace mcphost
{

/// @brief Host process orchestrator: owns the config store and the lifecycle manager.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The loaded configuration (log level and lifecycle timeouts).
    /// @param configPath The file the server configurations are read from and seeded into.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Seeds default servers if none are configured and starts all enabled servers.
    /// @return Success, or an error if the server configurations cannot be read.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Blocks until @p stopRequested becomes true, then shuts all servers down.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(const std::atomic<bool>& stopRequested) -> int;

    /// @brief Prints every configured server with its status to stdout.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto listServers() -> int;

    /// @brief Probes one configured server and prints its tools to stdout.
    /// @return Exit code (0 if the server is usable).
    [[nodiscard]] auto validate(std::string_view name) -> int;

    /// @brief Stops all servers. Idempotent.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphost
