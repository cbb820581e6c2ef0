// SPDX-License-Identifier: Apache-2.0
#include "LifecycleManager.hpp"

#include <core/Event.hpp>
#include <core/Log.hpp>

#include <exception>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace mcphost
{

namespace
{

    /// @brief Bookkeeping of one lifecycle task.
    ///
    /// `state`, `initSucceeded` and `failure` are guarded by the manager's mutex.
    struct LifecycleTask
    {
        LifecycleTask(std::string name, std::shared_ptr<McpResource> resource):
            name(std::move(name)), resource(std::move(resource))
        {
        }

        std::string const name;
        std::shared_ptr<McpResource> const resource;

        Event initDone;
        Event shutdownRequested;
        Event finished;

        ServerState state = ServerState::Starting;
        bool initSucceeded = false;
        std::string failure;

        std::mutex threadMutex;
        std::jthread thread;

        /// @brief Joins the task thread if it has finished, detaches it otherwise.
        ///
        /// Must be called before the task leaves the manager's bookkeeping.
        void releaseThread()
        {
            auto lock = std::lock_guard(threadMutex);
            if (!thread.joinable())
                return;
            if (finished.isSet() && thread.get_id() != std::this_thread::get_id())
                thread.join();
            else
                thread.detach();
        }
    };

    using TaskPtr = std::shared_ptr<LifecycleTask>;

} // namespace

struct LifecycleManager::Impl: std::enable_shared_from_this<LifecycleManager::Impl>
{
    LifecycleTimeouts timeouts;
    ResourceFactory factory;

    mutable std::mutex mutex;
    std::map<std::string, TaskPtr, std::less<>> tasks;
    RunningServers running;
    std::map<std::string, std::string, std::less<>> failures;
    bool shuttingDown = false;

    std::mutex listenersMutex;
    std::map<std::uint64_t, LifecycleListener> listeners;
    std::uint64_t nextListenerId = 1;

    // {{{ task side

    /// @brief Body of a lifecycle task thread: owns the open..close span of one resource.
    void runTask(const TaskPtr& task)
    {
        if (!openResource(task))
        {
            closeResource(task);
            task->finished.set();
            return;
        }

        auto published = false;
        {
            auto lock = std::lock_guard(mutex);
            auto const it = tasks.find(task->name);
            if (it != tasks.end() && it->second == task && !task->shutdownRequested.isSet())
            {
                running[task->name] = task->resource;
                task->state = ServerState::Running;
                task->initSucceeded = true;
                published = true;
            }
            else
            {
                task->failure = "start was abandoned before the server finished opening";
            }
        }
        task->initDone.set();

        if (published)
        {
            log::debug("Lifecycle task of MCP server '{}' is up", task->name);
            task->shutdownRequested.wait();
        }
        else
        {
            log::info("MCP server '{}' opened after its start was abandoned, closing it", task->name);
        }

        unpublish(task);
        closeResource(task);
        log::debug("Lifecycle task of MCP server '{}' finished", task->name);
        task->finished.set();
    }

    auto openResource(const TaskPtr& task) -> bool
    {
        auto failure = std::string {};
        try
        {
            auto result = task->resource->open();
            if (result)
                return true;
            failure = result.error().message;
        }
        catch (const std::exception& e)
        {
            failure = std::format("unexpected error while opening: {}", e.what());
        }

        log::error("Failed to open MCP server '{}': {}", task->name, failure);
        {
            auto lock = std::lock_guard(mutex);
            task->initSucceeded = false;
            task->failure = std::move(failure);
        }
        task->initDone.set();
        return false;
    }

    void closeResource(const TaskPtr& task)
    {
        try
        {
            task->resource->close();
        }
        catch (const std::exception& e)
        {
            log::error("Error while closing MCP server '{}': {}", task->name, e.what());
        }
    }

    /// @brief Removes the task's registry entry, unless a newer task owns the name by now.
    void unpublish(const TaskPtr& task)
    {
        auto lock = std::lock_guard(mutex);
        auto const it = running.find(task->name);
        if (it != running.end() && it->second == task->resource)
            running.erase(it);
        if (task->state == ServerState::Running)
            task->state = ServerState::Stopping;
    }

    // }}}
    // {{{ caller side

    auto findTask(std::string_view name) const -> TaskPtr
    {
        auto lock = std::lock_guard(mutex);
        auto const it = tasks.find(name);
        return it != tasks.end() ? it->second : nullptr;
    }

    /// @brief Drops a task from the bookkeeping (if it is still the tracked one) and releases its thread.
    void forget(const TaskPtr& task)
    {
        task->releaseThread();

        auto lock = std::lock_guard(mutex);
        auto const it = tasks.find(task->name);
        if (it != tasks.end() && it->second == task)
            tasks.erase(it);
        auto const entry = running.find(task->name);
        if (entry != running.end() && entry->second == task->resource)
            running.erase(entry);
    }

    void recordFailure(std::string_view name, std::string reason)
    {
        {
            auto lock = std::lock_guard(mutex);
            failures.insert_or_assign(std::string(name), reason);
        }
        notify(LifecycleEventKind::Failed, name, std::move(reason));
    }

    void notify(LifecycleEventKind kind, std::string_view name, std::string detail = {})
    {
        auto targets = std::vector<LifecycleListener> {};
        {
            auto lock = std::lock_guard(listenersMutex);
            for (const auto& [id, listener]: listeners)
                targets.push_back(listener);
        }

        auto const event = LifecycleEvent { .kind = kind, .serverName = std::string(name), .detail = std::move(detail) };
        for (const auto& listener: targets)
        {
            try
            {
                listener(event);
            }
            catch (const std::exception& e)
            {
                log::error("Lifecycle listener failed for MCP server '{}': {}", name, e.what());
            }
        }
    }

    auto build(const ServerConfig& config) -> Result<std::shared_ptr<McpResource>>
    {
        if (!factory)
            return makeError(ErrorCode::ConfigError, "No resource factory configured");

        try
        {
            auto resource = factory(config);
            if (resource && !*resource)
                return makeError(ErrorCode::ConfigError, "Resource factory returned no resource");
            return resource;
        }
        catch (const std::exception& e)
        {
            return makeError(ErrorCode::ConfigError, std::format("Resource factory failed: {}", e.what()));
        }
    }

    auto startServer(std::string_view name, const ServerConfig& config) -> bool
    {
        if (isShuttingDown())
        {
            log::warning("Cannot start MCP server '{}': manager is shutting down", name);
            return false;
        }

        auto resource = build(config);
        if (!resource)
        {
            log::error("Invalid configuration for MCP server '{}': {}", name, resource.error().message);
            recordFailure(name, resource.error().message);
            return false;
        }

        auto task = std::make_shared<LifecycleTask>(std::string(name), std::move(*resource));

        // Never spawn while another task owns the name; if a concurrent caller got in
        // between, stop its task as well and try again.
        while (true)
        {
            if (findTask(name))
            {
                log::info("MCP server '{}' is already tracked, stopping it first", name);
                stopServer(name);
            }

            auto lock = std::lock_guard(mutex);
            if (shuttingDown)
            {
                log::warning("Cannot start MCP server '{}': manager is shutting down", name);
                return false;
            }
            if (tasks.contains(name))
                continue;

            failures.erase(task->name);
            tasks.emplace(task->name, task);
            auto threadLock = std::lock_guard(task->threadMutex);
            task->thread = std::jthread([self = shared_from_this(), task] { self->runTask(task); });
            break;
        }

        if (!task->initDone.waitFor(timeouts.init))
        {
            log::error("Timeout starting MCP server '{}' after {} ms", name, timeouts.init.count());
            task->shutdownRequested.set();
            forget(task);
            recordFailure(name, std::format("timed out after {} ms", timeouts.init.count()));
            return false;
        }

        auto succeeded = false;
        auto failure = std::string {};
        {
            auto lock = std::lock_guard(mutex);
            succeeded = task->initSucceeded;
            failure = task->failure;
        }

        if (!succeeded)
        {
            // The task closes its resource right after reporting the failure.
            if (!task->finished.waitFor(timeouts.stop))
                log::warning("MCP server '{}' did not finish closing after a failed start", name);
            forget(task);
            recordFailure(name, failure.empty() ? "initialization failed" : std::move(failure));
            return false;
        }

        log::info("Started MCP server: {}", name);
        notify(LifecycleEventKind::Started, name);
        return true;
    }

    auto stopServer(std::string_view name) -> bool
    {
        auto task = TaskPtr {};
        {
            auto lock = std::lock_guard(mutex);
            failures.erase(std::string(name));
            auto const it = tasks.find(name);
            if (it == tasks.end())
                return true;
            task = it->second;
            task->state = ServerState::Stopping;
        }

        task->shutdownRequested.set();

        if (!task->finished.waitFor(timeouts.stop))
            log::warning("Timed out after {} ms waiting for MCP server '{}' to close; abandoning its task",
                         timeouts.stop.count(),
                         name);

        forget(task);
        log::info("Stopped MCP server: {}", name);
        notify(LifecycleEventKind::Stopped, name);
        return true;
    }

    auto startEnabledServers(ConfigStore& store) -> Result<StartSummary>
    {
        auto configs = store.listEnabled();
        if (!configs)
        {
            log::error("Failed to read MCP server configurations: {}", configs.error().message);
            return std::unexpected(configs.error());
        }

        auto summary = StartSummary { .total = configs->size() };
        if (configs->empty())
        {
            log::info("No enabled MCP servers configured");
            return summary;
        }

        log::info("Starting {} enabled MCP servers...", configs->size());

        auto results = std::vector<char>(configs->size(), 0);
        {
            auto workers = std::vector<std::jthread> {};
            workers.reserve(configs->size());
            for (auto i = size_t { 0 }; i < configs->size(); ++i)
            {
                workers.emplace_back([this, &results, &configs, i] {
                    auto const& config = (*configs)[i];
                    results[i] = startServer(config.name, config) ? 1 : 0;
                });
            }
        }

        for (auto i = size_t { 0 }; i < configs->size(); ++i)
        {
            if (results[i])
                ++summary.started;
            else
                summary.failed.push_back((*configs)[i].name);
        }

        log::info("Successfully started {}/{} MCP servers", summary.started, summary.total);
        return summary;
    }

    auto isShuttingDown() const -> bool
    {
        auto lock = std::lock_guard(mutex);
        return shuttingDown;
    }

    void shutdown()
    {
        auto names = std::vector<std::string> {};
        {
            auto lock = std::lock_guard(mutex);
            if (shuttingDown)
                return;
            shuttingDown = true;
            for (const auto& [name, task]: tasks)
                names.push_back(name);
        }

        if (names.empty())
        {
            log::debug("No MCP servers running, nothing to shut down");
            auto lock = std::lock_guard(mutex);
            failures.clear();
            shuttingDown = false;
            return;
        }

        log::info("Shutting down {} MCP servers...", names.size());

        // Stop phase: one worker per server, all bounded by a common deadline.
        auto const stopDeadline = std::chrono::steady_clock::now() + timeouts.shutdown;
        auto workers = std::vector<std::pair<std::jthread, std::shared_ptr<Event>>> {};
        for (const auto& name: names)
        {
            auto done = std::make_shared<Event>();
            auto worker = std::jthread([self = shared_from_this(), name, done] {
                self->stopServer(name);
                done->set();
            });
            workers.emplace_back(std::move(worker), std::move(done));
        }

        auto unfinished = size_t { 0 };
        for (auto& [worker, done]: workers)
        {
            if (done->waitUntil(stopDeadline))
            {
                worker.join();
            }
            else
            {
                ++unfinished;
                worker.detach();
            }
        }
        if (unfinished > 0)
            log::warning("Timeout during graceful shutdown, forcing cleanup of {} MCP servers", unfinished);

        // Grace phase: give remaining lifecycle tasks a last chance to close.
        auto remaining = std::vector<TaskPtr> {};
        {
            auto lock = std::lock_guard(mutex);
            for (const auto& [name, task]: tasks)
                remaining.push_back(task);
        }

        if (!remaining.empty())
        {
            log::info("Waiting for {} remaining lifecycle tasks", remaining.size());
            auto const graceDeadline = std::chrono::steady_clock::now() + timeouts.grace;
            auto pending = size_t { 0 };
            for (const auto& task: remaining)
            {
                task->shutdownRequested.set();
                if (!task->finished.waitUntil(graceDeadline))
                    ++pending;
                task->releaseThread();
            }
            if (pending > 0)
                log::warning("{} lifecycle tasks did not complete in time", pending);
        }

        {
            auto lock = std::lock_guard(mutex);
            tasks.clear();
            running.clear();
            failures.clear();
            shuttingDown = false;
        }

        log::info("All MCP servers have been shut down");
    }

    // }}}
};

LifecycleManager::LifecycleManager(LifecycleTimeouts timeouts, ResourceFactory factory):
    _impl(std::make_shared<Impl>())
{
    _impl->timeouts = timeouts;
    _impl->factory = std::move(factory);
}

LifecycleManager::~LifecycleManager()
{
    _impl->shutdown();
}

auto LifecycleManager::startServer(std::string_view name, const ServerConfig& config) -> bool
{
    return _impl->startServer(name, config);
}

auto LifecycleManager::stopServer(std::string_view name) -> bool
{
    return _impl->stopServer(name);
}

auto LifecycleManager::restartServer(std::string_view name, const ServerConfig& config) -> bool
{
    log::info("Restarting MCP server: {}", name);
    stopServer(name);
    return startServer(name, config);
}

auto LifecycleManager::startEnabledServers(ConfigStore& store) -> Result<StartSummary>
{
    return _impl->startEnabledServers(store);
}

auto LifecycleManager::runningServers() const -> RunningServers
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->running;
}

auto LifecycleManager::runningServerNames() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_impl->running.size());
    for (const auto& [name, resource]: _impl->running)
        names.push_back(name);
    return names;
}

auto LifecycleManager::isRunning(std::string_view name) const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->running.contains(std::string(name));
}

auto LifecycleManager::stateOf(std::string_view name) const -> ServerState
{
    auto lock = std::lock_guard(_impl->mutex);
    if (auto const it = _impl->tasks.find(name); it != _impl->tasks.end())
        return it->second->state;
    if (_impl->failures.contains(name))
        return ServerState::Failed;
    return ServerState::NotStarted;
}

auto LifecycleManager::statusOf(const ServerConfig& config) const -> ServerStatus
{
    switch (stateOf(config.name))
    {
        case ServerState::Running: return ServerStatus::Running;
        case ServerState::Starting:
        case ServerState::Stopping: return ServerStatus::Unknown;
        case ServerState::Failed: return config.enabled ? ServerStatus::Error : ServerStatus::Disabled;
        case ServerState::NotStarted: return config.enabled ? ServerStatus::Stopped : ServerStatus::Disabled;
    }
    return ServerStatus::Unknown;
}

auto LifecycleManager::trackedCount() const -> size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->tasks.size();
}

auto LifecycleManager::isShuttingDown() const -> bool
{
    return _impl->isShuttingDown();
}

auto LifecycleManager::timeouts() const -> const LifecycleTimeouts&
{
    return _impl->timeouts;
}

auto LifecycleManager::subscribe(LifecycleListener listener) -> std::uint64_t
{
    auto lock = std::lock_guard(_impl->listenersMutex);
    auto const id = _impl->nextListenerId++;
    _impl->listeners.emplace(id, std::move(listener));
    return id;
}

void LifecycleManager::unsubscribe(std::uint64_t subscription)
{
    auto lock = std::lock_guard(_impl->listenersMutex);
    _impl->listeners.erase(subscription);
}

void LifecycleManager::shutdown()
{
    _impl->shutdown();
}

} // namespace mcphost
