// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentLoop.hpp>
#include <agent/RunHandle.hpp>
#include <conversation/ConversationState.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace agentshell
{

/// @brief Top-level coordinator of user input and agent runs.
///
/// At most one run is live at a time. Each run executes on its own thread; submit() and
/// cancelCurrent() first cancel the live run and wait until it has reached a terminal state,
/// so a new run never observes a pending call of the previous one.
class SessionController
{
  public:
    SessionController(ConversationState& state, AgentLoop& loop);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// @brief Cancels any live run, appends the user message and starts a new run.
    /// @return The id of the new run.
    auto submit(std::string userText) -> std::uint64_t;

    /// @brief Cancels the live run and waits until it has finished.
    /// @return The outcome of the cancelled run, or nullopt if no run was live.
    auto cancelCurrent() -> std::optional<RunOutcome>;

    /// @brief Waits for the current run to finish.
    /// @return Its outcome, or nullopt if there is no run or it did not finish in time.
    [[nodiscard]] auto wait(std::chrono::milliseconds timeout = std::chrono::hours(24)) -> std::optional<RunOutcome>;

    /// @brief Returns true while a run is executing.
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Returns the outcome of the most recently finished run.
    [[nodiscard]] auto lastOutcome() const -> std::optional<RunOutcome>;

    /// @brief Returns the state of the current (or last) run, Idle before the first one.
    [[nodiscard]] auto currentState() const -> RunState;

  private:
    ConversationState& _state;
    AgentLoop& _loop;

    mutable std::mutex _controlMutex; // serializes submit / cancel / shutdown
    std::shared_ptr<RunHandle> _current;
    std::jthread _worker;

    auto stopLocked() -> std::optional<RunOutcome>;
    [[nodiscard]] auto currentHandle() const -> std::shared_ptr<RunHandle>;
};

} // namespace agentshell
