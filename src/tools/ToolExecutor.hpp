// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <tools/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stop_token>
#include <string>

namespace agentshell
{

/// @brief Runtime instance of one tool call.
struct ToolInvocation
{
    std::string id;
    std::string toolName;
    nlohmann::json arguments;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
    std::stop_token stopToken;
};

/// @brief Runs single tool invocations and normalizes every outcome into a ToolResult.
///
/// execute() never throws: unknown tools, schema violations, handler errors and exceptions,
/// failed operations, timeouts and cancellation all become error results. Each call performs
/// the tool's side effect at most once; nothing is cached or deduplicated.
class ToolExecutor
{
  public:
    explicit ToolExecutor(const ToolRegistry& registry);

    [[nodiscard]] auto execute(const ToolInvocation& invocation) const noexcept -> ToolResult;

  private:
    const ToolRegistry& _registry;

    [[nodiscard]] auto run(const ToolInvocation& invocation) const -> ToolResult;
};

} // namespace agentshell
