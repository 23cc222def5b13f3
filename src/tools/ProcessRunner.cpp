// SPDX-License-Identifier: Apache-2.0
#include "ProcessRunner.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace agentshell
{

namespace
{

    /// @brief Granularity at which cancellation and the deadline are checked while waiting.
    constexpr auto PollInterval = std::chrono::milliseconds(50);

    /// @brief Owns a pipe file descriptor.
    struct Fd
    {
        int fd = -1;

        Fd() = default;
        explicit Fd(int value): fd(value) {}
        Fd(const Fd&) = delete;
        Fd& operator=(const Fd&) = delete;
        ~Fd() { reset(); }

        void reset()
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    };

    /// @brief Appends to a capture buffer up to a limit.
    void capture(std::string& buffer, std::string_view data, std::size_t limit, bool& truncated)
    {
        auto const room = buffer.size() < limit ? limit - buffer.size() : 0;
        if (data.size() > room)
            truncated = true;
        buffer.append(data.substr(0, room));
    }

    void killGroup(pid_t pid)
    {
        ::kill(-pid, SIGKILL);
        auto status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
    }

} // namespace

auto runProcess(const ProcessRequest& request, std::stop_token stopToken) -> Result<ProcessResult>
{
    auto const startedAt = std::chrono::steady_clock::now();
    auto const deadline = startedAt + request.timeout;

    int stdoutPipe[2];
    int stderrPipe[2];
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ToolExecutionError, "Failed to create stdout pipe");
    auto stdoutRead = Fd(stdoutPipe[0]);
    auto stdoutWrite = Fd(stdoutPipe[1]);

    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ToolExecutionError, "Failed to create stderr pipe");
    auto stderrRead = Fd(stderrPipe[0]);
    auto stderrWrite = Fd(stderrPipe[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutWrite.fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrWrite.fd, STDERR_FILENO);
    if (!request.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, request.workingDirectory.c_str());

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    // Build argv
    auto shell = std::string("/bin/sh");
    auto flag = std::string("-c");
    auto commandLine = request.commandLine;
    auto argv = std::array<char*, 4> { shell.data(), flag.data(), commandLine.data(), nullptr };

    // Build environment (inherit + request overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!request.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: request.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawn(&pid, shell.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    stdoutWrite.reset();
    stderrWrite.reset();

    if (status != 0)
        return makeError(ErrorCode::ToolExecutionError,
                         std::format("Failed to spawn '{}': {}", request.commandLine, std::strerror(status)));

    log::debug("Spawned pid {}: {}", pid, request.commandLine);

    auto result = ProcessResult {};
    auto fds = std::array<pollfd, 2> { {
        { .fd = stdoutRead.fd, .events = POLLIN, .revents = 0 },
        { .fd = stderrRead.fd, .events = POLLIN, .revents = 0 },
    } };
    auto openStreams = 2;
    auto buf = std::array<char, 4096> {};

    while (openStreams > 0)
    {
        if (stopToken.stop_requested())
        {
            killGroup(pid);
            log::info("Cancelled command (pid {}): {}", pid, request.commandLine);
            return makeError(ErrorCode::Cancelled, std::format("Command cancelled: {}", request.commandLine));
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            killGroup(pid);
            log::warning("Command timed out after {} ms: {}", request.timeout.count(), request.commandLine);
            return makeError(ErrorCode::TimedOut,
                             std::format("Command timed out after {} ms: {}", request.timeout.count(),
                                         request.commandLine));
        }

        auto const ready = ::poll(fds.data(), fds.size(), static_cast<int>(PollInterval.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            killGroup(pid);
            return makeError(ErrorCode::ToolExecutionError, std::format("poll() failed: {}", std::strerror(errno)));
        }

        for (auto i = std::size_t { 0 }; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                continue;

            auto const n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0)
            {
                auto& target = i == 0 ? result.stdoutText : result.stderrText;
                capture(target, std::string_view(buf.data(), static_cast<std::size_t>(n)), request.maxOutputBytes,
                        result.truncated);
            }
            else if (n == 0 || errno != EINTR)
            {
                fds[i].fd = -1; // EOF: poll ignores negative descriptors
                --openStreams;
            }
        }
    }

    // Both pipes closed; the shell may still be exiting, or a background child may hold the group.
    auto waitStatus = 0;
    while (true)
    {
        auto const waited = ::waitpid(pid, &waitStatus, WNOHANG);
        if (waited == pid)
            break;
        if (waited < 0 && errno != EINTR)
            return makeError(ErrorCode::ToolExecutionError, std::format("waitpid() failed: {}", std::strerror(errno)));

        if (stopToken.stop_requested())
        {
            killGroup(pid);
            return makeError(ErrorCode::Cancelled, std::format("Command cancelled: {}", request.commandLine));
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            killGroup(pid);
            return makeError(ErrorCode::TimedOut,
                             std::format("Command timed out after {} ms: {}", request.timeout.count(),
                                         request.commandLine));
        }
        ::usleep(static_cast<useconds_t>(std::chrono::microseconds(PollInterval).count()) / 5);
    }

    if (WIFEXITED(waitStatus))
        result.exitCode = WEXITSTATUS(waitStatus);
    else if (WIFSIGNALED(waitStatus))
        result.exitCode = 128 + WTERMSIG(waitStatus);

    result.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt);
    return result;
}

} // namespace agentshell
