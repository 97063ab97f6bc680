// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Async.hpp>
#include <core/Log.hpp>
#include <mcp/LineFramer.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <csignal>
#include <cstring>
#include <deque>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpdesk
{

namespace asio = boost::asio;

namespace
{
    constexpr auto ShellPath = "/bin/sh";
    constexpr auto TerminateGracePeriod = std::chrono::milliseconds { 500 };
    constexpr auto ReapPollInterval = std::chrono::milliseconds { 50 };

    auto needsQuoting(std::string_view arg) -> bool
    {
        return arg.find_first_of(" \t\n\r\f\v\"'\\$`") != std::string_view::npos;
    }

    auto forceQuote(std::string_view arg) -> std::string
    {
        auto quoted = std::string { "\"" };
        for (auto const ch: arg)
        {
            if (ch == '"' || ch == '\\' || ch == '$' || ch == '`')
                quoted += '\\';
            quoted += ch;
        }
        quoted += '"';
        return quoted;
    }

    auto setCloseOnExec(int fd) -> bool
    {
        auto const flags = ::fcntl(fd, F_GETFD);
        return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
    }

    auto makePipe(std::array<int, 2>& fds) -> bool
    {
        if (::pipe(fds.data()) != 0)
            return false;
        if (setCloseOnExec(fds[0]) && setCloseOnExec(fds[1]))
            return true;
        ::close(fds[0]);
        ::close(fds[1]);
        return false;
    }

    void closePipe(std::array<int, 2>& fds)
    {
        for (auto& fd: fds)
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    }

    /// Inherited environment with the configured entries replacing same-named variables.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged[key] = value;

        auto strings = std::vector<std::string> {};
        strings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            strings.push_back(std::format("{}={}", key, value));
        return strings;
    }

    // A write to a server that closed its stdin must fail with EPIPE, not terminate the host.
    void ignoreBrokenPipes()
    {
        static auto const installed = std::signal(SIGPIPE, SIG_IGN) != SIG_ERR;
        static_cast<void>(installed);
    }

    auto describeExit(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("Process exited with code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("Process terminated by signal {}", WTERMSIG(status));
        return "Process ended";
    }
} // namespace

auto shellQuoteArgument(std::string_view arg) -> std::string
{
    if (!needsQuoting(arg))
        return std::string(arg);
    return forceQuote(arg);
}

auto buildShellCommand(const StdioTransportConfig& config) -> std::string
{
    auto line = std::string {};

    if (config.cwd && !config.cwd->empty())
        line += std::format("cd {} && ", forceQuote(*config.cwd));

    line += config.command;
    for (const auto& arg: config.args)
    {
        line += ' ';
        line += shellQuoteArgument(arg);
    }
    return line;
}

struct StdioTransport::Impl
{
    Impl(asio::any_io_executor executor, StdioTransportConfig cfg, std::string serverId):
        config(std::move(cfg)),
        logger(std::format("stdio:{}", serverId)),
        stdinPipe(executor),
        stdoutPipe(executor),
        stderrPipe(executor)
    {
    }

    StdioTransportConfig config;
    log::Logger logger;
    pid_t childPid = -1;
    asio::posix::stream_descriptor stdinPipe;
    asio::posix::stream_descriptor stdoutPipe;
    asio::posix::stream_descriptor stderrPipe;
    LineFramer framer;
    std::deque<std::string> outbox;
    bool writing = false;
    bool connected = false;
    bool closing = false;
};

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config, std::string serverId):
    _impl(std::make_unique<Impl>(std::move(executor), std::move(config), std::move(serverId)))
{
}

StdioTransport::~StdioTransport()
{
    terminateChild();
}

auto StdioTransport::start() -> asio::awaitable<VoidResult>
{
    if (_impl->connected)
        co_return makeError(ErrorCode::TransportError, "Transport already connected");

    ignoreBrokenPipes();

    auto stdinFds = std::array<int, 2> { -1, -1 };
    auto stdoutFds = std::array<int, 2> { -1, -1 };
    auto stderrFds = std::array<int, 2> { -1, -1 };

    if (!makePipe(stdinFds))
        co_return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (!makePipe(stdoutFds))
    {
        closePipe(stdinFds);
        co_return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }
    if (!makePipe(stderrFds))
    {
        closePipe(stdinFds);
        closePipe(stdoutFds);
        co_return makeError(ErrorCode::TransportError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinFds[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutFds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrFds[1], STDERR_FILENO);

    // Own process group, so close() can signal the shell and everything it started.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    auto commandLine = buildShellCommand(_impl->config);
    auto shell = std::string { ShellPath };
    auto dashC = std::string { "-c" };
    auto argv = std::array<char*, 4> { shell.data(), dashC.data(), commandLine.data(), nullptr };

    auto envStrings = buildEnvironment(_impl->config.env);
    auto envp = std::vector<char*> {};
    envp.reserve(envStrings.size() + 1);
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawn(&pid, ShellPath, &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    ::close(stdinFds[0]);
    ::close(stdoutFds[1]);
    ::close(stderrFds[1]);

    if (status != 0)
    {
        ::close(stdinFds[1]);
        ::close(stdoutFds[0]);
        ::close(stderrFds[0]);
        co_return makeError(ErrorCode::TransportError,
                            std::format("Failed to spawn '{}': {}", commandLine, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinPipe.assign(stdinFds[1]);
    _impl->stdoutPipe.assign(stdoutFds[0]);
    _impl->stderrPipe.assign(stderrFds[0]);
    _impl->connected = true;
    _impl->closing = false;

    auto executor = _impl->stdoutPipe.get_executor();
    asio::co_spawn(executor, readStdout(shared_from_this()), asio::detached);
    asio::co_spawn(executor, readStderr(shared_from_this()), asio::detached);

    _impl->logger.info("Spawned pid {}: {}", pid, commandLine);
    co_return VoidResult {};
}

auto StdioTransport::send(nlohmann::json message) -> asio::awaitable<VoidResult>
{
    if (!_impl->connected)
        co_return makeError(ErrorCode::TransportError, "Transport not connected");

    auto self = shared_from_this();
    _impl->logger.trace("-> {}", message.dump());
    _impl->outbox.push_back(message.dump() + "\n");

    // The coroutine that is already writing drains everything queued behind it.
    if (_impl->writing)
        co_return VoidResult {};

    _impl->writing = true;
    while (!_impl->outbox.empty())
    {
        auto data = std::move(_impl->outbox.front());
        _impl->outbox.pop_front();

        auto ec = boost::system::error_code {};
        co_await asio::async_write(
            _impl->stdinPipe, asio::buffer(data), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            _impl->writing = false;
            _impl->outbox.clear();
            co_return makeError(ErrorCode::TransportError,
                                std::format("Failed to write to process stdin: {}", ec.message()));
        }
    }
    _impl->writing = false;

    co_return VoidResult {};
}

auto StdioTransport::close() -> asio::awaitable<void>
{
    auto self = shared_from_this();

    if (!_impl->connected && _impl->childPid <= 0)
        co_return;

    _impl->logger.debug("Closing transport");
    _impl->closing = true;
    _impl->connected = false;

    auto ec = boost::system::error_code {};
    _impl->stdinPipe.close(ec);
    _impl->stdoutPipe.close(ec);
    _impl->stderrPipe.close(ec);

    if (_impl->childPid > 0)
    {
        auto const pid = _impl->childPid;
        ::kill(-pid, SIGTERM);

        auto reaped = false;
        auto status = 0;
        for (auto waited = std::chrono::milliseconds { 0 }; waited < TerminateGracePeriod;
             waited += ReapPollInterval)
        {
            if (::waitpid(pid, &status, WNOHANG) != 0)
            {
                reaped = true;
                break;
            }
            co_await sleepFor(ReapPollInterval);
        }

        if (!reaped)
        {
            _impl->logger.warning("pid {} ignored SIGTERM, sending SIGKILL", pid);
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
        _impl->childPid = -1;
    }

    _impl->framer.clear();
    _impl->outbox.clear();
    emitClose("Transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> int
{
    return _impl->childPid;
}

auto StdioTransport::readStdout(std::shared_ptr<StdioTransport> self) -> asio::awaitable<void>
{
    auto buffer = std::array<char, 4096> {};

    while (true)
    {
        auto ec = boost::system::error_code {};
        auto const bytesRead = co_await _impl->stdoutPipe.async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));

        if (ec)
            break;

        for (auto& message: _impl->framer.feed(std::string_view(buffer.data(), bytesRead)))
        {
            _impl->logger.trace("<- {}", message.dump());
            emitMessage(std::move(message));
        }
    }

    if (_impl->closing)
        co_return;

    // The child closed stdout on its own; collect its exit status if it is already gone.
    auto reason = std::string { "Process closed its output" };
    if (_impl->childPid > 0)
    {
        for (auto attempt = 0; attempt < 10; ++attempt)
        {
            auto status = 0;
            if (::waitpid(_impl->childPid, &status, WNOHANG) == _impl->childPid)
            {
                reason = describeExit(status);
                _impl->childPid = -1;
                break;
            }
            co_await sleepFor(ReapPollInterval);
        }
    }

    _impl->connected = false;
    _impl->logger.warning("{}", reason);
    emitClose(reason);
}

auto StdioTransport::readStderr(std::shared_ptr<StdioTransport> self) -> asio::awaitable<void>
{
    auto buffer = std::array<char, 4096> {};
    auto pending = std::string {};

    while (true)
    {
        auto ec = boost::system::error_code {};
        auto const bytesRead = co_await _impl->stderrPipe.async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            break;

        pending.append(buffer.data(), bytesRead);
        for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n'))
        {
            if (pos > 0)
                _impl->logger.debug("stderr: {}", std::string_view(pending).substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }

    if (!pending.empty())
        _impl->logger.debug("stderr: {}", pending);
}

void StdioTransport::terminateChild()
{
    auto ec = boost::system::error_code {};
    _impl->stdinPipe.close(ec);
    _impl->stdoutPipe.close(ec);
    _impl->stderrPipe.close(ec);

    if (_impl->childPid > 0)
    {
        ::kill(-_impl->childPid, SIGKILL);
        auto status = 0;
        ::waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
    }
    _impl->connected = false;
}

} // namespace mcpdesk
