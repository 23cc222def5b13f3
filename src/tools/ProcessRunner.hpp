// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <stop_token>
#include <string>

namespace agentshell
{

/// @brief What to run and under which limits.
struct ProcessRequest
{
    std::string commandLine;
    std::filesystem::path workingDirectory;
    std::map<std::string, std::string> env; // merged over the inherited environment
    std::chrono::milliseconds timeout { 30000 };
    std::size_t maxOutputBytes = 64 * 1024; // per stream; excess is dropped and flagged
};

/// @brief Captured outcome of a process that ran to completion.
struct ProcessResult
{
    int exitCode = 0;
    std::string stdoutText;
    std::string stderrText;
    bool truncated = false;
    std::chrono::milliseconds duration { 0 };
};

/// @brief Runs a shell command line via `/bin/sh -c` and captures its output.
///
/// The child gets its own process group. On timeout or when `stopToken` fires, the whole
/// group is killed with SIGKILL and the call returns TimedOut or Cancelled without waiting for
/// the command to finish on its own. Output already captured is discarded in that case.
/// @return The result, or TimedOut, Cancelled, or ToolExecutionError if spawning failed.
[[nodiscard]] auto runProcess(const ProcessRequest& request, std::stop_token stopToken) -> Result<ProcessResult>;

} // namespace agentshell
