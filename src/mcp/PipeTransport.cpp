// SPDX-License-Identifier: Apache-2.0
#include "PipeTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpbridge
{

namespace
{
    constexpr auto PollInterval = std::chrono::milliseconds(100);
    constexpr auto GracefulShutdownTimeout = std::chrono::milliseconds(2000);
    constexpr auto StderrTailLimit = size_t { 8192 };

    void ignoreSigPipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto makePipe(int (&fds)[2]) -> bool
    {
        if (::pipe(fds) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// Waits for readability; returns false on timeout.
    auto waitReadable(int fd) -> bool
    {
        auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
        return ::poll(&pfd, 1, static_cast<int>(PollInterval.count())) > 0;
    }

    auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r") == std::string_view::npos;
    }
} // namespace

struct PipeTransport::Impl
{
    PipeTransportConfig config;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;

    std::mutex lifecycleMutex;
    std::mutex writeMutex;

    mutable std::mutex stderrMutex;
    std::string stderrTail;

    std::jthread reader;
    std::jthread stderrReader;

    void terminateChild();
};

void PipeTransport::Impl::terminateChild()
{
    if (childPid <= 0)
        return;

    ::kill(childPid, SIGTERM);

    auto const deadline = std::chrono::steady_clock::now() + GracefulShutdownTimeout;
    auto status = 0;
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == childPid || (rc < 0 && errno != EINTR))
        {
            childPid = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    log::warning("Process '{}' did not exit after SIGTERM, sending SIGKILL", config.command);
    ::kill(childPid, SIGKILL);
    while (::waitpid(childPid, &status, 0) < 0 && errno == EINTR)
        ;
    childPid = -1;
}

PipeTransport::PipeTransport(PipeTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

PipeTransport::~PipeTransport()
{
    disconnect();
}

auto PipeTransport::connect() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->childPid > 0)
        return makeError(ErrorCode::ConnectionError, "Transport already connected");

    ignoreSigPipe();
    auto const& config = _impl->config;

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (!makePipe(stdinPipe))
        return makeError(ErrorCode::ConnectionError, "Failed to create stdin pipe");
    if (!makePipe(stdoutPipe))
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::ConnectionError, "Failed to create stdout pipe");
    }
    if (!makePipe(stderrPipe))
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::ConnectionError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit, then let config entries override)
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
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->closing = false;
    _impl->connected = true;

    _impl->reader = std::jthread([this](std::stop_token stopToken) { readLoop(stopToken); });
    _impl->stderrReader = std::jthread([this](std::stop_token stopToken) { stderrLoop(stopToken); });

    log::info("Tool server process started: {} (pid {})", config.command, pid);
    return {};
}

void PipeTransport::readLoop(std::stop_token stopToken)
{
    auto buffer = std::string {};
    auto chunk = std::array<char, 4096> {};

    while (!stopToken.stop_requested())
    {
        if (!waitReadable(_impl->stdoutRead))
            continue;

        auto const bytesRead = ::read(_impl->stdoutRead, chunk.data(), chunk.size());
        if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
            continue;

        if (bytesRead <= 0)
        {
            _impl->connected = false;
            if (!_impl->closing)
            {
                log::warning("Tool server process '{}' closed its output", _impl->config.command);
                dispatchClose("Process exited");
            }
            return;
        }

        buffer.append(chunk.data(), static_cast<size_t>(bytesRead));

        auto newlinePos = buffer.find('\n');
        while (newlinePos != std::string::npos)
        {
            auto line = buffer.substr(0, newlinePos);
            buffer.erase(0, newlinePos + 1);
            newlinePos = buffer.find('\n');

            if (isBlank(line))
                continue;

            auto message = json::parse(line);
            if (!message)
            {
                log::warning("Discarding unparseable line from '{}': {}", _impl->config.command, line);
                continue;
            }

            log::trace("<- {}", line);
            dispatchMessage(std::move(*message));
        }
    }
}

void PipeTransport::stderrLoop(std::stop_token stopToken)
{
    auto pending = std::string {};
    auto chunk = std::array<char, 1024> {};

    while (!stopToken.stop_requested())
    {
        if (!waitReadable(_impl->stderrRead))
            continue;

        auto const bytesRead = ::read(_impl->stderrRead, chunk.data(), chunk.size());
        if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        if (bytesRead <= 0)
            return;

        auto const text = std::string_view(chunk.data(), static_cast<size_t>(bytesRead));
        {
            auto lock = std::lock_guard(_impl->stderrMutex);
            _impl->stderrTail.append(text);
            if (_impl->stderrTail.size() > StderrTailLimit)
                _impl->stderrTail.erase(0, _impl->stderrTail.size() - StderrTailLimit);
        }

        pending.append(text);
        auto newlinePos = pending.find('\n');
        while (newlinePos != std::string::npos)
        {
            auto const line = pending.substr(0, newlinePos);
            pending.erase(0, newlinePos + 1);
            newlinePos = pending.find('\n');

            if (isBlank(line))
                continue;

            // Servers commonly announce themselves on stderr.
            if (line.find("running on") != std::string::npos)
                log::debug("[{}] {}", _impl->config.command, line);
            else
                log::warning("[{}] {}", _impl->config.command, line);
        }
    }
}

auto PipeTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto lock = std::lock_guard(_impl->writeMutex);
    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto const line = json::serialize(message);
    log::trace("-> {}", line);
    auto const data = line + "\n";

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::ConnectionError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    return {};
}

void PipeTransport::disconnect()
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->childPid <= 0 && !_impl->reader.joinable())
        return;

    _impl->closing = true;
    _impl->connected = false;

    {
        auto writeLock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->terminateChild();

    for (auto* thread: { &_impl->reader, &_impl->stderrReader })
    {
        thread->request_stop();
        if (!thread->joinable())
            continue;
        if (thread->get_id() == std::this_thread::get_id())
            thread->detach();
        else
            thread->join();
    }

    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);

    log::debug("Tool server transport closed: {}", _impl->config.command);
}

auto PipeTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto PipeTransport::stderrOutput() const -> std::string
{
    auto lock = std::lock_guard(_impl->stderrMutex);
    return _impl->stderrTail;
}

} // namespace mcpbridge
