// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief What a tool handler produced.
///
/// A handler that ran but whose operation failed (e.g. a command exiting non-zero) reports
/// `failed` together with whatever output it captured; errors that prevented the operation
/// from running at all are returned as an Error instead.
struct ToolOutput
{
    std::string text;
    bool failed = false;
    std::string failureDetail;
};

/// @brief Executable side of a tool.
///
/// Handlers receive arguments that already passed schema validation. Long-running handlers
/// must poll `stopToken` and return ErrorCode::Cancelled promptly once stop is requested.
class ToolHandler
{
  public:
    virtual ~ToolHandler() = default;

    [[nodiscard]] virtual auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> = 0;
};

/// @brief Defines a tool that the model can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::shared_ptr<ToolHandler> handler;

    /// @brief Name of the remote server providing this tool; empty for local tools.
    std::string owner;

    /// @brief Whether arguments not declared in `parameters` are passed through.
    bool allowAdditionalArguments = false;

    [[nodiscard]] auto isRemote() const -> bool { return !owner.empty(); }
};

} // namespace agentshell
