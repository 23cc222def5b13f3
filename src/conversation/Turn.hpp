// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace agentshell
{

/// @brief A message typed by the user.
struct UserMessage
{
    std::string text;
};

/// @brief Text produced by the model. Grows while streaming, frozen once finished.
struct AssistantMessage
{
    std::string text;
    bool finished = false;
};

/// @brief A tool call issued by the model. `cancelled` marks a call that will never get a result.
struct ToolCallTurn
{
    ToolCall call;
    bool cancelled = false;
};

/// @brief The result of a previously issued tool call.
struct ToolResultTurn
{
    ToolResult result;
};

/// @brief One atomic unit of the transcript.
using Turn = std::variant<UserMessage, AssistantMessage, ToolCallTurn, ToolResultTurn>;

/// @brief Returns a short lowercase name of the turn kind, e.g. for logging.
[[nodiscard]] inline auto turnKind(const Turn& turn) -> std::string_view
{
    struct Visitor
    {
        auto operator()(const UserMessage&) const -> std::string_view { return "user"; }
        auto operator()(const AssistantMessage&) const -> std::string_view { return "assistant"; }
        auto operator()(const ToolCallTurn&) const -> std::string_view { return "tool_call"; }
        auto operator()(const ToolResultTurn&) const -> std::string_view { return "tool_result"; }
    };
    return std::visit(Visitor {}, turn);
}

} // namespace agentshell
