// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConfigStore.hpp>
#include <mcp/McpResource.hpp>
#include <mcp/ResourceFactory.hpp>
#include <mcp/ServerConfig.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief Lifecycle state of one server name.
enum class ServerState : std::uint8_t
{
    NotStarted,
    Starting,
    Running,
    Stopping,
    Failed, ///< The last start attempt failed; no task or connection is held.
};

[[nodiscard]] constexpr auto serverStateToString(ServerState state) -> std::string_view
{
    switch (state)
    {
        case ServerState::NotStarted: return "not-started";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Operational status of a configured server, as reported to administrators.
enum class ServerStatus : std::uint8_t
{
    Running,
    Stopped,
    Disabled,
    Error,
    Unknown,
};

[[nodiscard]] constexpr auto serverStatusToString(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Running: return "running";
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Disabled: return "disabled";
        case ServerStatus::Error: return "error";
        case ServerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

/// @brief Upper bounds for every blocking wait of the manager.
struct LifecycleTimeouts
{
    /// @brief How long startServer() waits for a server to open.
    std::chrono::milliseconds init { 30000 };

    /// @brief How long stopServer() waits for a server's task to finish closing.
    std::chrono::milliseconds stop { 10000 };

    /// @brief Overall bound of the concurrent stop phase of shutdown().
    std::chrono::milliseconds shutdown { 20000 };

    /// @brief Extra wait for straggling tasks after the stop phase of shutdown().
    std::chrono::milliseconds grace { 3000 };
};

/// @brief Outcome of a bulk start.
struct StartSummary
{
    size_t total = 0;
    size_t started = 0;
    std::vector<std::string> failed;
};

enum class LifecycleEventKind : std::uint8_t
{
    Started,
    Stopped,
    Failed,
};

/// @brief Notification about a server lifecycle transition.
struct LifecycleEvent
{
    LifecycleEventKind kind = LifecycleEventKind::Started;
    std::string serverName;

    /// @brief Failure reason for LifecycleEventKind::Failed, empty otherwise.
    std::string detail;
};

/// @brief Receives lifecycle events on the thread that performed the manager operation.
using LifecycleListener = std::function<void(const LifecycleEvent&)>;

/// @brief Snapshot of the running connections, keyed by server name.
using RunningServers = std::map<std::string, std::shared_ptr<McpResource>>;

/// @brief Starts, tracks, restarts and shuts down MCP servers.
///
/// Every server is owned by a dedicated lifecycle task (one thread) that opens the
/// server's resource, publishes it in the running registry, waits for a shutdown signal
/// and closes the resource again. Nothing else ever opens or closes a resource; callers
/// only send start/stop signals and read snapshots of the registry.
///
/// For each name there is at most one live task at a time: starting a name that is
/// already tracked stops the previous task first. All blocking waits are bounded by
/// LifecycleTimeouts; a wait that times out degrades to forced bookkeeping cleanup.
///
/// Concurrent callers operating on the same name are serialized at the bookkeeping level
/// only; the order in which they take effect is unspecified.
class LifecycleManager
{
  public:
    explicit LifecycleManager(LifecycleTimeouts timeouts = {}, ResourceFactory factory = buildResource);

    /// @brief Shuts down all servers.
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /// @brief Builds a resource from the config and starts it under the given name.
    ///
    /// Stops a previously tracked server of the same name first. Blocks until the server
    /// is open or LifecycleTimeouts::init elapsed. Rejected while shutdown() runs.
    /// @return true iff the server is running when the call returns.
    [[nodiscard]] auto startServer(std::string_view name, const ServerConfig& config) -> bool;

    /// @brief Signals the server's task to close and waits for it (bounded by LifecycleTimeouts::stop).
    ///
    /// Idempotent. On timeout the task is abandoned and its bookkeeping cleared; the
    /// task still closes its resource whenever its close() returns.
    /// @return true; stopping an unknown name is not an error.
    auto stopServer(std::string_view name) -> bool;

    /// @brief stopServer() followed by startServer(). Not atomic.
    [[nodiscard]] auto restartServer(std::string_view name, const ServerConfig& config) -> bool;

    /// @brief Starts every enabled server of the store concurrently.
    ///
    /// A failing server never prevents the others from starting.
    /// @return The per-server outcome, or the store's error.
    [[nodiscard]] auto startEnabledServers(ConfigStore& store) -> Result<StartSummary>;

    /// @brief Returns a point-in-time copy of the running registry.
    ///
    /// An entry may be closed concurrently after the snapshot was taken.
    [[nodiscard]] auto runningServers() const -> RunningServers;

    [[nodiscard]] auto runningServerNames() const -> std::vector<std::string>;

    [[nodiscard]] auto isRunning(std::string_view name) const -> bool;

    [[nodiscard]] auto stateOf(std::string_view name) const -> ServerState;

    /// @brief Derives the administrative status of a configured server.
    [[nodiscard]] auto statusOf(const ServerConfig& config) const -> ServerStatus;

    /// @brief Number of names with a start attempt in flight or a running server.
    [[nodiscard]] auto trackedCount() const -> size_t;

    [[nodiscard]] auto isShuttingDown() const -> bool;

    [[nodiscard]] auto timeouts() const -> const LifecycleTimeouts&;

    /// @brief Registers a listener. Listener exceptions are logged and otherwise ignored.
    /// @return A handle for unsubscribe().
    auto subscribe(LifecycleListener listener) -> std::uint64_t;

    void unsubscribe(std::uint64_t subscription);

    /// @brief Stops all servers concurrently and clears all bookkeeping.
    ///
    /// Returns within LifecycleTimeouts::shutdown + LifecycleTimeouts::grace (plus scheduling
    /// latency), even if some server never finishes closing.
    void shutdown();

    struct Impl;

  private:
    std::shared_ptr<Impl> _impl;
};

} // namespace mcphost
