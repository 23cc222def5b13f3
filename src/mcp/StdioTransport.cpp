// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace agentshell
{

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::string readBuffer;
    std::string command;

    /// @brief Pops one complete, non-empty line from the read buffer.
    auto takeLine() -> std::optional<std::string>
    {
        while (true)
        {
            auto const newlinePos = readBuffer.find('\n');
            if (newlinePos == std::string::npos)
                return std::nullopt;

            auto line = readBuffer.substr(0, newlinePos);
            readBuffer.erase(0, newlinePos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                return line;
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    int stdinPipe[2];
    int stdoutPipe[2];

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
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
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
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::info("Tool server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to '{}': {}", _impl->command, std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    log::trace("-> {}", data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        if (auto line = _impl->takeLine())
        {
            log::trace("<- {}", *line);
            return json::parse(*line);
        }

        if (!_impl->connected)
            return makeError(ErrorCode::TransportError, "Transport not connected");

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimedOut, "No message from tool server within timeout");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("Tool server '{}' closed its output", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    _impl->connected = false;

    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGTERM);
        int status;
        ::waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
        log::debug("Tool server '{}' stopped", _impl->command);
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace agentshell
