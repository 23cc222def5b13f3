// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <tools/ToolExecutor.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell
{

/// @brief States of one agent run.
enum class RunState
{
    Idle,
    ModelTurn,
    Dispatching,
    Done,
    Failed,
};

[[nodiscard]] constexpr auto runStateName(RunState state) -> std::string_view
{
    switch (state)
    {
        case RunState::Idle: return "Idle";
        case RunState::ModelTurn: return "ModelTurn";
        case RunState::Dispatching: return "Dispatching";
        case RunState::Done: return "Done";
        case RunState::Failed: return "Failed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr auto isTerminal(RunState state) -> bool
{
    return state == RunState::Done || state == RunState::Failed;
}

/// @brief How a run ended.
struct RunOutcome
{
    std::uint64_t runId = 0;
    RunState state = RunState::Idle;
    std::string finalText;
    int cycles = 0;
    std::optional<Error> error;

    [[nodiscard]] auto succeeded() const -> bool { return state == RunState::Done; }
    [[nodiscard]] auto wasCancelled() const -> bool { return error && error->code == ErrorCode::Cancelled; }
};

/// @brief One agent run bound to one user input.
///
/// Owns the run's cancellation source, whose token is handed to the model stream and to
/// every tool invocation, and records the invocations the run spawned.
class RunHandle
{
  public:
    explicit RunHandle(std::uint64_t runId);

    RunHandle(const RunHandle&) = delete;
    RunHandle& operator=(const RunHandle&) = delete;

    [[nodiscard]] auto runId() const -> std::uint64_t { return _runId; }

    [[nodiscard]] auto stopToken() const -> std::stop_token { return _stopSource.get_token(); }

    /// @brief Requests cooperative cancellation of the run.
    /// @return True if this call made the request.
    auto requestCancel() -> bool;

    [[nodiscard]] auto isCancelRequested() const -> bool { return _stopSource.stop_requested(); }

    [[nodiscard]] auto state() const -> RunState { return _state.load(); }
    void setState(RunState state);

    /// @brief Records an invocation spawned by this run.
    void addInvocation(const ToolInvocation& invocation);

    /// @brief Returns the ids of all invocations spawned so far, in dispatch order.
    [[nodiscard]] auto invocationIds() const -> std::vector<std::string>;

    /// @brief Stores the outcome, moves to its terminal state and wakes all waiters.
    void finish(RunOutcome outcome);

    /// @brief Waits until the run has finished.
    /// @return The outcome, or nullopt if it did not finish in time.
    [[nodiscard]] auto waitForOutcome(std::chrono::milliseconds timeout) const -> std::optional<RunOutcome>;

    /// @brief Returns the outcome if the run has finished.
    [[nodiscard]] auto outcome() const -> std::optional<RunOutcome>;

  private:
    std::uint64_t _runId;
    std::stop_source _stopSource;
    std::atomic<RunState> _state = RunState::Idle;

    mutable std::mutex _mutex;
    mutable std::condition_variable _finished;
    std::vector<ToolInvocation> _invocations;
    std::optional<RunOutcome> _outcome;
};

} // namespace agentshell
