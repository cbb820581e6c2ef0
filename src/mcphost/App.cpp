// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <mcp/LifecycleManager.hpp>
#include <mcp/ServerValidator.hpp>
#include <mcphost/Bootstrap.hpp>
#include <mcphost/FileConfigStore.hpp>

#include <chrono>
#include <print>
#include <thread>

namespace mcphost
{

namespace
{
    constexpr auto StopPollInterval = std::chrono::milliseconds { 100 };
} // namespace

struct App::Impl
{
    AppConfig config;
    FileConfigStore store;
    LifecycleManager manager;
    std::uint64_t subscription = 0;

    Impl(AppConfig cfg, std::string configPath):
        config(std::move(cfg)), store(std::move(configPath)), manager(config.lifecycle)
    {
        subscription = manager.subscribe([](const LifecycleEvent& event) {
            if (event.kind == LifecycleEventKind::Failed)
                log::debug("Lifecycle event: MCP server '{}' failed: {}", event.serverName, event.detail);
        });
    }

    ~Impl() { manager.unsubscribe(subscription); }

    /// @brief Logs every running server together with the tools it offers.
    void logRunningServers()
    {
        for (const auto& [name, resource]: manager.runningServers())
        {
            auto tools = resource->listTools();
            if (!tools)
            {
                log::warning("Failed to list tools of MCP server '{}': {}", name, tools.error());
                continue;
            }

            log::info("MCP server '{}' offers {} tools", name, tools->size());
            for (const auto& tool: *tools)
                log::debug("  {}: {}", tool.name, tool.description);
        }
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App()
{
    shutdown();
}

auto App::initialize() -> VoidResult
{
    log::info("Using MCP server configuration from {}", _impl->store.path());

    auto summary = bootstrap(_impl->manager, _impl->store);
    if (!summary)
        return std::unexpected(summary.error());

    _impl->logRunningServers();
    return {};
}

auto App::run(const std::atomic<bool>& stopRequested) -> int
{
    log::info("mcphost is running with {} MCP servers. Press Ctrl+C to stop.", _impl->manager.trackedCount());

    while (!stopRequested.load())
        std::this_thread::sleep_for(StopPollInterval);

    log::info("Stop requested");
    shutdown();
    return 0;
}

auto App::listServers() -> int
{
    auto servers = _impl->store.listAll();
    if (!servers)
    {
        log::error("Failed to read MCP server configurations: {}", servers.error());
        return 1;
    }

    if (servers->empty())
    {
        std::println("No MCP servers configured in {}", _impl->store.path());
        return 0;
    }

    for (const auto& server: *servers)
    {
        std::println("{:<24} {:<16} {:<9} {}",
                     server.name,
                     serverKindToString(server.kind),
                     serverStatusToString(_impl->manager.statusOf(server)),
                     server.command);
    }
    return 0;
}

auto App::validate(std::string_view name) -> int
{
    auto server = _impl->store.find(name);
    if (!server)
    {
        log::error("{}", server.error());
        return 1;
    }

    auto tools = validateServer(*server);
    if (!tools)
    {
        std::println("MCP server '{}' is not usable: {}", name, tools.error().message);
        return 1;
    }

    std::println("MCP server '{}' is usable and offers {} tools:", name, tools->size());
    for (const auto& tool: *tools)
        std::println("  {:<32} {}", tool.name, tool.description);
    return 0;
}

void App::shutdown()
{
    if (_impl->manager.trackedCount() > 0)
        _impl->manager.shutdown();
}

} // namespace mcphost
