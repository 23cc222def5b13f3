// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolDefinition.hpp>
#include <tools/Workspace.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell
{

/// @brief Entry names skipped by every listing and search tool.
[[nodiscard]] auto defaultIgnorePatterns() -> const std::vector<std::string>&;

/// @brief `list_directory`: lists a directory, directories first, with optional match/ignore globs.
class ListDirectoryTool: public ToolHandler
{
  public:
    explicit ListDirectoryTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief `directory_tree`: renders a directory recursively as an indented tree.
class DirectoryTreeTool: public ToolHandler
{
  public:
    explicit DirectoryTreeTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief `grep`: plain substring search over files, reporting `path:line: text`.
class GrepTool: public ToolHandler
{
  public:
    explicit GrepTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief Returns the definitions of the listing and search tools, bound to the workspace.
[[nodiscard]] auto searchToolDefinitions(std::shared_ptr<const Workspace> workspace) -> std::vector<ToolDefinition>;

} // namespace agentshell
