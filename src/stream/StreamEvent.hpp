// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace agentshell
{

/// @brief A chunk of assistant text appended to the streaming message at `turnIndex`.
struct AssistantDelta
{
    std::size_t turnIndex = 0;
    std::string text;
};

/// @brief A tool call has been dispatched for execution.
struct ToolCallStarted
{
    ToolCall call;
};

/// @brief A tool result has been appended to the transcript.
struct ToolResultAppended
{
    std::string toolName;
    nlohmann::json arguments;
    ToolResult result;
};

/// @brief The run ended with a final assistant message.
struct RunFinished
{
    std::string finalText;
    int cycles = 0;
};

/// @brief The run ended in failure (including cancellation).
struct RunFailed
{
    Error error;
};

using StreamPayload = std::variant<AssistantDelta, ToolCallStarted, ToolResultAppended, RunFinished, RunFailed>;

/// @brief An event as delivered to subscribers, stamped with its global publication order.
struct StreamEvent
{
    std::uint64_t sequence = 0;
    std::uint64_t runId = 0;
    StreamPayload payload;
};

/// @brief Returns true if both events are assistant deltas of the same message and may be merged.
[[nodiscard]] inline auto canCoalesce(const StreamEvent& first, const StreamEvent& second) -> bool
{
    auto const* a = std::get_if<AssistantDelta>(&first.payload);
    auto const* b = std::get_if<AssistantDelta>(&second.payload);
    return a && b && first.runId == second.runId && a->turnIndex == b->turnIndex;
}

/// @brief Returns true for events that end a run.
[[nodiscard]] inline auto isTerminal(const StreamEvent& event) -> bool
{
    return std::holds_alternative<RunFinished>(event.payload) || std::holds_alternative<RunFailed>(event.payload);
}

} // namespace agentshell
