// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcphost/App.hpp>
#include <mcphost/Config.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>

namespace
{
    auto stopRequested = std::atomic<bool> { false };

    void handleStopSignal(int /*signal*/)
    {
        stopRequested.store(true);
    }
} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphost - MCP server lifecycle manager" };

    auto configPath = std::string {};
    auto validateName = std::string {};
    auto verbose = false;
    auto listOnly = false;
    auto once = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--validate", validateName, "Probe the named MCP server and list its tools");
    app.add_flag("--list", listOnly, "List configured MCP servers and exit");
    app.add_flag("--once", once, "Start all enabled servers, report, and shut down again");

    CLI11_PARSE(app, argc, argv);

    if (configPath.empty())
        configPath = mcphost::defaultConfigPath();

    // A missing file is not an error: bootstrap seeds it with the default servers.
    auto configResult = std::filesystem::exists(configPath) ? mcphost::loadConfigFromFile(configPath)
                                                            : mcphost::Result<mcphost::AppConfig> {};
    if (!configResult)
    {
        mcphost::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    mcphost::log::setLevel(verbose ? mcphost::log::Level::Debug : config.logLevel);

    auto application = mcphost::App(std::move(config), configPath);

    if (listOnly)
        return application.listServers();

    if (!validateName.empty())
        return application.validate(validateName);

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
    // Server pipes and sockets may close at any time; report EPIPE instead of dying.
    std::signal(SIGPIPE, SIG_IGN);

    auto initResult = application.initialize();
    if (!initResult)
    {
        mcphost::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (once)
        stopRequested.store(true);

    return application.run(stopRequested);
}
