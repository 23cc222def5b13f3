// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <tools/FileTools.hpp>
#include <tools/TerminalTool.hpp>
#include <tools/ToolRegistry.hpp>
#include <tools/Workspace.hpp>

#include <memory>

namespace agentshell
{

/// @brief Settings of the built-in tools.
struct LocalToolsConfig
{
    TerminalToolConfig terminal;
    FileToolsConfig files;
};

/// @brief Registers the built-in terminal, file-edit and search tools.
/// @return Success or the first registration error (e.g. DuplicateName).
[[nodiscard]] auto registerLocalTools(ToolRegistry& registry,
                                      std::shared_ptr<const Workspace> workspace,
                                      const LocalToolsConfig& config) -> VoidResult;

} // namespace agentshell
