// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolDefinition.hpp>
#include <tools/Workspace.hpp>

#include <memory>
#include <vector>

namespace agentshell
{

/// @brief Limits of the file tools.
struct FileToolsConfig
{
    std::size_t maxReadBytes = 256 * 1024;
};

/// @brief `read_file`: returns numbered lines of a file, optionally a 1-based line range.
class ReadFileTool: public ToolHandler
{
  public:
    ReadFileTool(std::shared_ptr<const Workspace> workspace, FileToolsConfig config);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
    FileToolsConfig _config;
};

/// @brief `write_file`: creates or atomically replaces a file.
class WriteFileTool: public ToolHandler
{
  public:
    explicit WriteFileTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief `patch_file`: applies a unified diff to a file, all hunks or nothing.
class PatchFileTool: public ToolHandler
{
  public:
    explicit PatchFileTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief `replace_in_file`: replaces every exact occurrence of a text in a file.
class ReplaceInFileTool: public ToolHandler
{
  public:
    explicit ReplaceInFileTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief `insert_in_file`: inserts text after a given line, 0 meaning the start of the file.
class InsertInFileTool: public ToolHandler
{
  public:
    explicit InsertInFileTool(std::shared_ptr<const Workspace> workspace);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<const Workspace> _workspace;
};

/// @brief Returns the definitions of all file-edit tools, bound to the workspace.
[[nodiscard]] auto fileToolDefinitions(std::shared_ptr<const Workspace> workspace, FileToolsConfig config)
    -> std::vector<ToolDefinition>;

} // namespace agentshell
