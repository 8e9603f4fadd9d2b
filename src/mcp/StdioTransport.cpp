// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace webchat
{

namespace
{

    constexpr auto DefaultPath = std::string_view { "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin" };
    constexpr auto DefaultShell = std::string_view { "/bin/sh" };
    constexpr auto PollIntervalMs = 100;
    constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

    void ignoreSigPipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto describeExit(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("exited with code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("terminated by signal {}", WTERMSIG(status));
        return "stopped";
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

} // namespace

auto hostEnvironment() -> std::map<std::string, std::string>
{
    auto env = std::map<std::string, std::string> {};
    if (!environ)
        return env;

    for (auto** e = environ; *e; ++e)
    {
        auto const entry = std::string_view(*e);
        auto const eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return env;
}

auto buildChildEnvironment(const std::map<std::string, std::string>& hostEnv,
                           const std::map<std::string, std::string>& overlay)
    -> std::map<std::string, std::string>
{
    auto env = hostEnv;

    auto const setDefault = [&env](const std::string& key, std::string_view value) {
        auto const it = env.find(key);
        if ((it == env.end() || it->second.empty()) && !value.empty())
            env[key] = std::string(value);
    };

    auto const* const pw = ::getpwuid(::getuid());

    // A parent started from a launcher may carry an almost empty environment.
    setDefault("PATH", DefaultPath);
    setDefault("HOME", pw && pw->pw_dir ? std::string_view(pw->pw_dir) : std::string_view {});
    setDefault("SHELL", pw && pw->pw_shell && *pw->pw_shell ? std::string_view(pw->pw_shell) : DefaultShell);
    setDefault("USER", pw && pw->pw_name ? std::string_view(pw->pw_name) : std::string_view {});

    for (const auto& [key, value]: overlay)
        env[key] = value;

    return env;
}

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    TransportEvents events;

    std::mutex processMutex;
    pid_t childPid = -1;

    std::mutex writeMutex;
    int stdinWrite = -1;
    int stdoutRead = -1;

    std::atomic<bool> connected { false };
    std::jthread reader;

    /// @brief Reaps the child without blocking; returns true once it is gone.
    auto tryReap() -> bool
    {
        auto const lock = std::lock_guard(processMutex);
        if (childPid <= 0)
            return true;

        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == 0)
            return false;

        if (rc == childPid)
            log::info("MCP server '{}' (pid {}) {}", config.command, childPid, describeExit(status));
        childPid = -1;
        return true;
    }

    /// @brief Terminates the child: SIGTERM, then SIGKILL after the grace period.
    void terminate()
    {
        {
            auto const lock = std::lock_guard(processMutex);
            if (childPid <= 0)
                return;
            ::kill(childPid, SIGTERM);
        }

        auto const deadline = std::chrono::steady_clock::now() + config.terminateGracePeriod;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (tryReap())
                return;
            std::this_thread::sleep_for(ReapPollInterval);
        }

        auto const lock = std::lock_guard(processMutex);
        if (childPid <= 0)
            return;
        log::warning("MCP server '{}' (pid {}) ignored SIGTERM, killing", config.command, childPid);
        ::kill(childPid, SIGKILL);
        auto status = 0;
        ::waitpid(childPid, &status, 0);
        childPid = -1;
    }

    void readLoop(const std::stop_token& stopToken)
    {
        auto buf = std::array<char, 4096> {};
        auto failure = std::optional<Error> {};

        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = stdoutRead, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, PollIntervalMs);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                failure = Error { ErrorCode::TransportError,
                                  std::format("poll on provider stdout failed: {}", std::strerror(errno)) };
                break;
            }
            if (rc == 0)
                continue;

            auto const bytesRead = ::read(stdoutRead, buf.data(), buf.size());
            if (bytesRead < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                failure = Error { ErrorCode::TransportError,
                                  std::format("read from provider stdout failed: {}", std::strerror(errno)) };
                break;
            }
            if (bytesRead == 0)
                break;

            if (events.onData)
                events.onData(std::string_view(buf.data(), static_cast<size_t>(bytesRead)));
        }

        // close() owns teardown when it asked us to stop.
        if (stopToken.stop_requested())
            return;

        connected = false;

        while (!tryReap())
        {
            if (stopToken.stop_requested())
                return;
            std::this_thread::sleep_for(ReapPollInterval);
        }

        if (failure)
        {
            if (events.onError)
                events.onError(*failure);
        }
        else if (events.onClosed)
        {
            events.onClosed();
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

auto StdioTransport::open(TransportEvents events) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto const& config = _impl->config;
    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command configured");

    // Leftovers from a previous run (process already exited).
    close();
    ignoreSigPipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];

    // O_CLOEXEC keeps these ends out of processes spawned for other providers.
    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // The child must not inherit our ignored SIGPIPE.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: buildChildEnvironment(hostEnvironment(), config.env))
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    // Writes must never block close(): a provider may stop reading its stdin.
    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);

    {
        auto const lock = std::lock_guard(_impl->processMutex);
        _impl->childPid = pid;
    }
    {
        auto const lock = std::lock_guard(_impl->writeMutex);
        _impl->stdinWrite = stdinPipe[1];
    }
    _impl->stdoutRead = stdoutPipe[0];
    _impl->events = std::move(events);
    _impl->connected = true;
    _impl->reader = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->readLoop(token); });

    log::info("MCP server started: {} (pid {})", describe(), pid);
    return {};
}

auto StdioTransport::send(std::string_view data) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);

    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto written = size_t { 0 };
    while (written < data.size())
    {
        auto const result = ::write(_impl->stdinWrite, data.data() + written, data.size() - written);
        if (result >= 0)
        {
            written += static_cast<size_t>(result);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));

        // Pipe full: wait for the provider to drain it, giving up once the transport is closing.
        auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        if (::poll(&pfd, 1, PollIntervalMs) < 0 && errno != EINTR)
            return makeError(ErrorCode::TransportError,
                             std::format("poll on process stdin failed: {}", std::strerror(errno)));
        if (!_impl->connected)
            return makeError(ErrorCode::TransportError,
                             std::format("Transport closed after writing {} of {} bytes", written, data.size()));
    }

    return {};
}

void StdioTransport::close()
{
    _impl->connected = false;

    if (!_impl->reader.joinable() && _impl->stdoutRead < 0 && processId() <= 0)
        return;

    if (_impl->reader.joinable())
    {
        _impl->reader.request_stop();
        if (_impl->reader.get_id() == std::this_thread::get_id())
            _impl->reader.detach();
    }

    {
        // Most providers exit on their own once stdin reaches EOF.
        auto const lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->terminate();

    if (_impl->reader.joinable())
        _impl->reader.join();

    closeFd(_impl->stdoutRead);
    log::debug("MCP transport closed: {}", describe());
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::describe() const -> std::string
{
    auto label = _impl->config.command;
    for (const auto& arg: _impl->config.args)
        label += " " + arg;
    return label;
}

auto StdioTransport::processId() const -> int
{
    auto const lock = std::lock_guard(_impl->processMutex);
    return _impl->childPid;
}

} // namespace webchat
