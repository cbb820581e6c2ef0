// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphost
{

namespace
{
    constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

    /// @brief Waits for the child to exit, polling until the deadline.
    /// @return true if the child was reaped.
    auto reapUntil(pid_t pid, std::chrono::steady_clock::time_point deadline) -> bool
    {
        while (true)
        {
            int status = 0;
            auto const rc = waitpid(pid, &status, WNOHANG);
            if (rc == pid || (rc < 0 && errno == ECHILD))
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(ReapPollInterval);
        }
    }

    /// @brief Blocks SIGPIPE on the calling thread for the guard's lifetime.
    ///
    /// A write to a pipe whose reader has exited raises SIGPIPE, which would terminate the
    /// whole process. While the guard is alive such a write fails with EPIPE instead; the
    /// signal it leaves pending is consumed before the previous mask is restored.
    class SigpipeGuard
    {
      public:
        SigpipeGuard()
        {
            sigemptyset(&_pipeSet);
            sigaddset(&_pipeSet, SIGPIPE);

            auto pending = sigset_t {};
            sigemptyset(&pending);
            sigpending(&pending);
            _wasPending = sigismember(&pending, SIGPIPE) == 1;

            _active = pthread_sigmask(SIG_BLOCK, &_pipeSet, &_previousMask) == 0;
        }

        ~SigpipeGuard()
        {
            if (!_active)
                return;

            if (_brokePipe && !_wasPending)
            {
                auto const noWait = timespec { .tv_sec = 0, .tv_nsec = 0 };
                while (sigtimedwait(&_pipeSet, nullptr, &noWait) < 0 && errno == EINTR)
                    ;
            }
            pthread_sigmask(SIG_SETMASK, &_previousMask, nullptr);
        }

        SigpipeGuard(const SigpipeGuard&) = delete;
        SigpipeGuard& operator=(const SigpipeGuard&) = delete;

        void notePipeBroken() noexcept { _brokePipe = true; }

      private:
        sigset_t _pipeSet {};
        sigset_t _previousMask {};
        bool _active = false;
        bool _wasPending = false;
        bool _brokePipe = false;
    };
} // namespace

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    bool connected = false;
    std::string readBuffer;

    void closePipes()
    {
        if (stdinWrite >= 0)
        {
            ::close(stdinWrite);
            stdinWrite = -1;
        }
        if (stdoutRead >= 0)
        {
            ::close(stdoutRead);
            stdoutRead = -1;
        }
    }
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start() -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto const& config = _impl->config;
    if (config.command.empty())
        return makeError(ErrorCode::ConfigError, "No command configured for stdio transport");

    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (!config.cwd.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.cwd.c_str());

    // Put the child into its own process group so terminal signals aimed at the host
    // do not reach it before close() has had a chance to shut it down.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherit the host environment; configured variables take precedence.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::debug("Spawned MCP server process '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto remaining = std::string_view(data);
    auto sigpipeGuard = SigpipeGuard {};

    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            auto const error = errno;
            if (error == EINTR)
                continue;
            if (error == EPIPE)
                sigpipeGuard.notePipeBroken();
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(error)));
        }
        remaining.remove_prefix(static_cast<size_t>(written));
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + _impl->config.timeout;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from '{}' within {} ms",
                                         _impl->config.command,
                                         _impl->config.timeout.count()));

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead <= 0)
        {
            if (bytesRead < 0 && errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    _impl->connected = false;
    _impl->closePipes();

    if (_impl->childPid <= 0)
        return;

    auto const pid = _impl->childPid;
    _impl->childPid = -1;

    // Closing stdin is the polite shutdown request; most servers exit on EOF.
    auto const clock = std::chrono::steady_clock::now;
    if (reapUntil(pid, clock() + std::chrono::milliseconds(100)))
    {
        log::debug("MCP server process {} exited", pid);
        return;
    }

    // The child leads its own process group; signal the whole group.
    kill(-pid, SIGTERM);
    if (reapUntil(pid, clock() + _impl->config.terminateGrace))
    {
        log::debug("MCP server process {} terminated", pid);
        return;
    }

    log::warning("MCP server process {} ignored SIGTERM, killing it", pid);
    kill(-pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::pid() const -> int
{
    return static_cast<int>(_impl->childPid);
}

} // namespace mcphost
