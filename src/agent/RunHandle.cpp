// SPDX-License-Identifier: Apache-2.0
#include "RunHandle.hpp"

#include <core/Log.hpp>

namespace agentshell
{

RunHandle::RunHandle(std::uint64_t runId): _runId(runId)
{
}

auto RunHandle::requestCancel() -> bool
{
    auto const requested = _stopSource.request_stop();
    if (requested)
        log::info("Cancellation requested for run {}", _runId);
    return requested;
}

void RunHandle::setState(RunState state)
{
    auto const previous = _state.exchange(state);
    if (previous != state)
        log::debug("Run {}: {} -> {}", _runId, runStateName(previous), runStateName(state));
}

void RunHandle::addInvocation(const ToolInvocation& invocation)
{
    auto lock = std::lock_guard(_mutex);
    _invocations.push_back(invocation);
}

auto RunHandle::invocationIds() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto ids = std::vector<std::string> {};
    ids.reserve(_invocations.size());
    for (const auto& invocation: _invocations)
        ids.push_back(invocation.id);
    return ids;
}

void RunHandle::finish(RunOutcome outcome)
{
    setState(outcome.state);
    {
        auto lock = std::lock_guard(_mutex);
        _outcome = std::move(outcome);
    }
    _finished.notify_all();
}

auto RunHandle::waitForOutcome(std::chrono::milliseconds timeout) const -> std::optional<RunOutcome>
{
    auto lock = std::unique_lock(_mutex);
    _finished.wait_for(lock, timeout, [this] { return _outcome.has_value(); });
    return _outcome;
}

auto RunHandle::outcome() const -> std::optional<RunOutcome>
{
    auto lock = std::lock_guard(_mutex);
    return _outcome;
}

} // namespace agentshell
