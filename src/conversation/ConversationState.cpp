// SPDX-License-Identifier: Apache-2.0
#include "ConversationState.hpp"

#include <core/Log.hpp>

#include <format>
#include <utility>

namespace agentshell
{

ConversationState::ConversationState(std::string systemPrompt): _systemPrompt(std::move(systemPrompt))
{
}

auto ConversationState::beginRun() -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);

    auto const leftovers = resolvePendingLocked();
    if (leftovers > 0)
        log::warning("{} tool call(s) of run {} were still pending, marked cancelled", leftovers, _runId);

    _runCalls.clear();
    _runCallOrder.clear();
    return ++_runId;
}

auto ConversationState::currentRun() const -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);
    return _runId;
}

auto ConversationState::appendUserMessage(std::string text) -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    _turns.emplace_back(UserMessage { .text = std::move(text) });
    return _turns.size() - 1;
}

auto ConversationState::beginAssistantMessage() -> Result<std::size_t>
{
    auto lock = std::lock_guard(_mutex);
    if (_streaming)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Assistant message #{} is still streaming", *_streaming));

    _turns.emplace_back(AssistantMessage { .text = {}, .finished = false });
    _streaming = _turns.size() - 1;
    return *_streaming;
}

auto ConversationState::appendAssistantText(std::size_t index, std::string_view delta) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_streaming != index)
        return makeError(ErrorCode::InvalidArgument, std::format("Turn #{} is not a streaming message", index));

    std::get<AssistantMessage>(_turns[index]).text += delta;
    return {};
}

auto ConversationState::finishAssistantMessage(std::size_t index) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_streaming != index)
        return makeError(ErrorCode::InvalidArgument, std::format("Turn #{} is not a streaming message", index));

    std::get<AssistantMessage>(_turns[index]).finished = true;
    _streaming.reset();
    return {};
}

auto ConversationState::appendAssistantMessage(std::string text) -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    _turns.emplace_back(AssistantMessage { .text = std::move(text), .finished = true });
    return _turns.size() - 1;
}

auto ConversationState::appendToolCall(ToolCall call) -> Result<std::size_t>
{
    auto lock = std::lock_guard(_mutex);
    if (_runCalls.contains(call.id))
        return makeError(ErrorCode::DuplicateName,
                         std::format("Tool call id '{}' already used in run {}", call.id, _runId));

    auto const index = _turns.size();
    _runCalls.emplace(call.id, CallEntry { .index = index, .state = CallState::Pending });
    _runCallOrder.push_back(call.id);
    _turns.emplace_back(ToolCallTurn { .call = std::move(call), .cancelled = false });
    return index;
}

auto ConversationState::appendToolResult(ToolResult result) -> Result<std::size_t>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _runCalls.find(result.callId);
    if (it == _runCalls.end())
        return makeError(ErrorCode::NotFound,
                         std::format("No tool call '{}' in run {}", result.callId, _runId));

    if (it->second.state != CallState::Pending)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool call '{}' is already resolved", result.callId));

    it->second.state = CallState::Resolved;
    _turns.emplace_back(ToolResultTurn { .result = std::move(result) });
    return _turns.size() - 1;
}

auto ConversationState::markCancelled(std::string_view callId) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _runCalls.find(callId);
    if (it == _runCalls.end())
        return makeError(ErrorCode::NotFound, std::format("No tool call '{}' in run {}", callId, _runId));

    if (it->second.state != CallState::Pending)
        return makeError(ErrorCode::InvalidArgument, std::format("Tool call '{}' is already resolved", callId));

    it->second.state = CallState::Cancelled;
    std::get<ToolCallTurn>(_turns[it->second.index]).cancelled = true;
    return {};
}

auto ConversationState::resolvePending() -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return resolvePendingLocked();
}

auto ConversationState::resolvePendingLocked() -> std::size_t
{
    if (_streaming)
    {
        std::get<AssistantMessage>(_turns[*_streaming]).finished = true;
        _streaming.reset();
    }

    auto count = std::size_t { 0 };
    for (auto& [id, entry]: _runCalls)
    {
        if (entry.state != CallState::Pending)
            continue;
        entry.state = CallState::Cancelled;
        std::get<ToolCallTurn>(_turns[entry.index]).cancelled = true;
        ++count;
    }
    return count;
}

auto ConversationState::pendingToolCalls() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto pending = std::vector<std::string> {};
    for (const auto& id: _runCallOrder)
    {
        if (_runCalls.find(id)->second.state == CallState::Pending)
            pending.push_back(id);
    }
    return pending;
}

auto ConversationState::isSettled() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (_streaming)
        return false;
    for (const auto& [id, entry]: _runCalls)
    {
        if (entry.state == CallState::Pending)
            return false;
    }
    return true;
}

auto ConversationState::snapshot() const -> std::vector<Turn>
{
    auto lock = std::lock_guard(_mutex);
    return _turns;
}

auto ConversationState::turnAt(std::size_t index) const -> std::optional<Turn>
{
    auto lock = std::lock_guard(_mutex);
    if (index >= _turns.size())
        return std::nullopt;
    return _turns[index];
}

auto ConversationState::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _turns.size();
}

void ConversationState::clear()
{
    auto lock = std::lock_guard(_mutex);
    _turns.clear();
    _runCalls.clear();
    _runCallOrder.clear();
    _streaming.reset();
}

auto ConversationState::systemPrompt() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _systemPrompt;
}

void ConversationState::setSystemPrompt(std::string prompt)
{
    auto lock = std::lock_guard(_mutex);
    _systemPrompt = std::move(prompt);
}

} // namespace agentshell
