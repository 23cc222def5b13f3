// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolDefinition.hpp>
#include <tools/Workspace.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief Limits and safety settings of the terminal tool.
struct TerminalToolConfig
{
    std::chrono::milliseconds timeout { 30000 };
    std::size_t maxOutputBytes = 64 * 1024;
    std::vector<std::string> blockedCommands = {
        "sudo", "su ", "chroot", "mount", "umount", "dd ", "fdisk", "mkfs", "rm -rf", "shutdown", "reboot", "halt",
        "poweroff",
    };
};

/// @brief `terminal_exec`: runs a command line inside the workspace and reports its output.
///
/// Arguments: `command` (required), `cwd` (relative to the workspace root), `env` (object of
/// string overrides), `timeout_ms`. A non-zero exit status is a failed operation whose output
/// is still returned.
class TerminalTool: public ToolHandler
{
  public:
    TerminalTool(std::shared_ptr<const Workspace> workspace, TerminalToolConfig config);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

    /// @brief Returns the registry definition bound to a new handler instance.
    [[nodiscard]] static auto definition(std::shared_ptr<const Workspace> workspace, TerminalToolConfig config)
        -> ToolDefinition;

  private:
    std::shared_ptr<const Workspace> _workspace;
    TerminalToolConfig _config;

    [[nodiscard]] auto checkBlocked(std::string_view command) const -> VoidResult;
};

} // namespace agentshell
