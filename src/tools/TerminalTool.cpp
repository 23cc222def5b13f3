// SPDX-License-Identifier: Apache-2.0
#include "TerminalTool.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tools/ProcessRunner.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace agentshell
{

namespace
{
    auto lowercase(std::string_view value) -> std::string
    {
        auto result = std::string(value);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto formatOutput(const ProcessResult& result) -> std::string
    {
        auto text = std::format("exit code: {} ({} ms)\n", result.exitCode, result.duration.count());
        if (!result.stdoutText.empty())
            text += std::format("stdout:\n{}\n", result.stdoutText);
        if (!result.stderrText.empty())
            text += std::format("stderr:\n{}\n", result.stderrText);
        if (result.truncated)
            text += "[output truncated]\n";
        return text;
    }
} // namespace

TerminalTool::TerminalTool(std::shared_ptr<const Workspace> workspace, TerminalToolConfig config):
    _workspace(std::move(workspace)), _config(std::move(config))
{
}

auto TerminalTool::definition(std::shared_ptr<const Workspace> workspace, TerminalToolConfig config) -> ToolDefinition
{
    return ToolDefinition {
        .name = "terminal_exec",
        .description = "Execute a shell command in the workspace and return its exit code, stdout and stderr.",
        .parameters = {
            { .name = "command", .type = "string", .description = "The command line to run with /bin/sh -c.", .required = true },
            { .name = "cwd", .type = "string", .description = "Working directory, relative to the workspace root.", .required = false },
            { .name = "env", .type = "object", .description = "Extra environment variables (string values).", .required = false },
            { .name = "timeout_ms", .type = "integer", .description = "Timeout in milliseconds.", .required = false },
        },
        .handler = std::make_shared<TerminalTool>(std::move(workspace), std::move(config)),
        .owner = {},
        .allowAdditionalArguments = false,
    };
}

auto TerminalTool::invoke(const nlohmann::json& arguments, std::stop_token stopToken) -> Result<ToolOutput>
{
    auto command = json::getString(arguments, "command");
    if (!command)
        return std::unexpected(command.error());

    if (auto blocked = checkBlocked(*command); !blocked)
        return std::unexpected(blocked.error());

    auto workingDirectory = _workspace->resolve(json::getStringOr(arguments, "cwd", "."));
    if (!workingDirectory)
        return std::unexpected(workingDirectory.error());

    auto ec = std::error_code {};
    if (!std::filesystem::is_directory(*workingDirectory, ec))
        return makeError(ErrorCode::ValidationError,
                         std::format("Working directory does not exist: {}", _workspace->relative(*workingDirectory)));

    auto request = ProcessRequest {
        .commandLine = *command,
        .workingDirectory = *workingDirectory,
        .env = json::getStringMap(arguments, "env"),
        .timeout = _config.timeout,
        .maxOutputBytes = _config.maxOutputBytes,
    };

    auto const timeoutMs = json::getIntOr(arguments, "timeout_ms", 0);
    if (timeoutMs > 0)
        request.timeout = std::min(std::chrono::milliseconds(timeoutMs), _config.timeout);

    auto result = runProcess(request, std::move(stopToken));
    if (!result)
        return std::unexpected(result.error());

    auto output = ToolOutput { .text = formatOutput(*result), .failed = false, .failureDetail = {} };
    if (result->exitCode != 0)
    {
        output.failed = true;
        output.failureDetail = std::format("Command exited with code {}", result->exitCode);
    }
    return output;
}

auto TerminalTool::checkBlocked(std::string_view command) const -> VoidResult
{
    auto const trimmed = command.find_first_not_of(" \t\n");
    if (trimmed == std::string_view::npos)
        return makeError(ErrorCode::ValidationError, "Command must not be empty");

    auto const lowered = lowercase(command);
    for (const auto& blocked: _config.blockedCommands)
    {
        auto const needle = lowercase(blocked);
        if (needle.empty())
            continue;

        // Match at word starts only: "sudo" but not "visudo".
        auto blockedHere = false;
        for (auto pos = lowered.find(needle); pos != std::string::npos; pos = lowered.find(needle, pos + 1))
        {
            if (pos == 0 || !std::isalnum(static_cast<unsigned char>(lowered[pos - 1])))
            {
                blockedHere = true;
                break;
            }
        }
        if (!blockedHere)
            continue;

        log::warning("Blocked command: {}", command);
        return makeError(ErrorCode::AccessDenied, std::format("Command contains blocked operation: {}", blocked));
    }
    return {};
}

} // namespace agentshell
