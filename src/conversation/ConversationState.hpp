// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/Turn.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief Append-only ordered log of turns shared by the agent loop and all panes.
///
/// All mutation goes through a single mutex, so readers never observe an interleaved or
/// half-written turn. Turns are immutable once appended, except a streaming assistant
/// message whose text grows until it is finished.
///
/// Tool call ids are scoped to a run: beginRun() starts a new scope, inside which every
/// call id is unique and receives at most one result.
class ConversationState
{
  public:
    /// @brief Constructs a ConversationState with an optional system prompt.
    /// @param systemPrompt The system prompt sent to the model alongside the transcript.
    explicit ConversationState(std::string systemPrompt = "");

    ConversationState(const ConversationState&) = delete;
    ConversationState& operator=(const ConversationState&) = delete;

    /// @brief Starts a new run scope.
    ///
    /// Any tool call left unresolved by a previous run is marked cancelled and any
    /// streaming assistant message is finished, so the new run never sees pending calls.
    /// @return The id of the new run.
    auto beginRun() -> std::uint64_t;

    /// @brief Returns the id of the current run scope (0 before the first run).
    [[nodiscard]] auto currentRun() const -> std::uint64_t;

    /// @brief Appends a user message.
    /// @return The index of the new turn.
    auto appendUserMessage(std::string text) -> std::size_t;

    /// @brief Appends an empty, unfinished assistant message that will receive streamed text.
    /// @return The index of the new turn, or InvalidArgument if another one is still streaming.
    [[nodiscard]] auto beginAssistantMessage() -> Result<std::size_t>;

    /// @brief Appends streamed text to an unfinished assistant message.
    [[nodiscard]] auto appendAssistantText(std::size_t index, std::string_view delta) -> VoidResult;

    /// @brief Freezes a streaming assistant message.
    [[nodiscard]] auto finishAssistantMessage(std::size_t index) -> VoidResult;

    /// @brief Appends a complete, finished assistant message.
    auto appendAssistantMessage(std::string text) -> std::size_t;

    /// @brief Appends a tool call of the current run.
    /// @return The index of the new turn, or DuplicateName if the id was already used in this run.
    [[nodiscard]] auto appendToolCall(ToolCall call) -> Result<std::size_t>;

    /// @brief Appends the result of a tool call of the current run.
    /// @return The index of the new turn; NotFound if no such call exists in the current run,
    ///         InvalidArgument if the call already has a result or was cancelled.
    [[nodiscard]] auto appendToolResult(ToolResult result) -> Result<std::size_t>;

    /// @brief Marks an unresolved tool call of the current run as cancelled.
    [[nodiscard]] auto markCancelled(std::string_view callId) -> VoidResult;

    /// @brief Finishes any streaming message and cancels every unresolved call of the current run.
    /// @return The number of calls marked cancelled.
    auto resolvePending() -> std::size_t;

    /// @brief Returns the ids of tool calls of the current run that have neither a result nor a
    ///        cancelled marker, in emission order.
    [[nodiscard]] auto pendingToolCalls() const -> std::vector<std::string>;

    /// @brief Returns true if no tool call is pending and no assistant message is streaming.
    [[nodiscard]] auto isSettled() const -> bool;

    /// @brief Returns a consistent copy of all turns.
    [[nodiscard]] auto snapshot() const -> std::vector<Turn>;

    /// @brief Returns a copy of the turn at the given index, if any.
    [[nodiscard]] auto turnAt(std::size_t index) const -> std::optional<Turn>;

    /// @brief Returns the number of turns.
    [[nodiscard]] auto size() const -> std::size_t;

    /// @brief Drops all turns and starts over with an empty transcript.
    void clear();

    [[nodiscard]] auto systemPrompt() const -> std::string;
    void setSystemPrompt(std::string prompt);

  private:
    enum class CallState
    {
        Pending,
        Resolved,
        Cancelled,
    };

    struct CallEntry
    {
        std::size_t index = 0;
        CallState state = CallState::Pending;
    };

    mutable std::mutex _mutex;
    std::string _systemPrompt;
    std::vector<Turn> _turns;
    std::uint64_t _runId = 0;
    std::map<std::string, CallEntry, std::less<>> _runCalls;
    std::vector<std::string> _runCallOrder;
    std::optional<std::size_t> _streaming;

    auto resolvePendingLocked() -> std::size_t;
};

} // namespace agentshell
