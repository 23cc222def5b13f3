// SPDX-License-Identifier: Apache-2.0
#include "SessionController.hpp"

#include <core/Log.hpp>

namespace agentshell
{

SessionController::SessionController(ConversationState& state, AgentLoop& loop): _state(state), _loop(loop)
{
}

SessionController::~SessionController()
{
    auto lock = std::lock_guard(_controlMutex);
    (void) stopLocked();
}

auto SessionController::submit(std::string userText) -> std::uint64_t
{
    auto lock = std::lock_guard(_controlMutex);

    if (auto previous = stopLocked(); previous)
        log::info("Run {} superseded by new input", previous->runId);

    auto const runId = _state.beginRun();
    _state.appendUserMessage(std::move(userText));

    _current = std::make_shared<RunHandle>(runId);
    _worker = std::jthread([this, handle = _current] { _loop.run(*handle); });

    log::debug("Run {} started", runId);
    return runId;
}

auto SessionController::cancelCurrent() -> std::optional<RunOutcome>
{
    auto lock = std::lock_guard(_controlMutex);
    return stopLocked();
}

auto SessionController::wait(std::chrono::milliseconds timeout) -> std::optional<RunOutcome>
{
    auto const handle = currentHandle();
    if (!handle)
        return std::nullopt;
    return handle->waitForOutcome(timeout);
}

auto SessionController::isRunning() const -> bool
{
    auto const handle = currentHandle();
    return handle && !handle->outcome();
}

auto SessionController::lastOutcome() const -> std::optional<RunOutcome>
{
    auto const handle = currentHandle();
    return handle ? handle->outcome() : std::nullopt;
}

auto SessionController::currentState() const -> RunState
{
    auto const handle = currentHandle();
    return handle ? handle->state() : RunState::Idle;
}

auto SessionController::stopLocked() -> std::optional<RunOutcome>
{
    if (!_current)
        return std::nullopt;

    auto const wasLive = !_current->outcome();
    if (wasLive)
        _current->requestCancel();

    if (_worker.joinable())
        _worker.join();

    // Already applied tool side effects stay; the loop only leaves the transcript replayable.
    return wasLive ? _current->outcome() : std::nullopt;
}

auto SessionController::currentHandle() const -> std::shared_ptr<RunHandle>
{
    auto lock = std::lock_guard(_controlMutex);
    return _current;
}

} // namespace agentshell
