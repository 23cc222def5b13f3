// SPDX-License-Identifier: Apache-2.0
#include "AgentLoop.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <thread>
#include <utility>

namespace agentshell
{

namespace
{
    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }
} // namespace

AgentLoop::AgentLoop(ConversationState& state,
                     const ToolRegistry& registry,
                     ModelClient& model,
                     StreamBroker& broker,
                     AgentConfig config):
    _state(state), _registry(registry), _executor(registry), _model(model), _broker(broker), _config(config)
{
}

auto AgentLoop::run(RunHandle& handle) -> RunOutcome
{
    auto outcome = RunOutcome {};
    try
    {
        outcome = drive(handle);
    }
    catch (const std::exception& e)
    {
        log::error("Run {} aborted by internal fault: {}", handle.runId(), e.what());
        outcome = fail(handle, Error { ErrorCode::Unknown, std::format("Internal error: {}", e.what()) }, 0);
    }

    handle.finish(outcome);
    return outcome;
}

auto AgentLoop::config() const -> const AgentConfig&
{
    return _config;
}

auto AgentLoop::drive(RunHandle& handle) -> RunOutcome
{
    auto cycles = 0;
    auto usedIds = std::set<std::string> {};

    while (true)
    {
        if (handle.isCancelRequested())
            return fail(handle, Error { ErrorCode::Cancelled, "Run cancelled" }, cycles);

        handle.setState(RunState::ModelTurn);
        log::debug("Run {}: model turn {}", handle.runId(), cycles + 1);

        auto turn = modelTurn(handle);
        if (!turn)
            return fail(handle, turn.error(), cycles);

        if (turn->calls.empty())
        {
            handle.setState(RunState::Done);
            _broker.publish(handle.runId(), RunFinished { .finalText = turn->text, .cycles = cycles });
            log::info("Run {} finished after {} tool cycle(s)", handle.runId(), cycles);
            return RunOutcome {
                .runId = handle.runId(),
                .state = RunState::Done,
                .finalText = std::move(turn->text),
                .cycles = cycles,
                .error = std::nullopt,
            };
        }

        if (auto appended = appendCalls(handle, turn->calls, usedIds); !appended)
            return fail(handle, appended.error(), cycles);

        if (cycles >= _config.maxIterations)
        {
            // The calls stay in the transcript, marked cancelled, so it remains replayable.
            log::warning("Run {} exceeded {} tool cycle(s)", handle.runId(), _config.maxIterations);
            return fail(handle,
                        Error { ErrorCode::IterationLimitExceeded,
                                std::format("Stopped after {} tool cycles; the model kept requesting tools",
                                            _config.maxIterations) },
                        cycles);
        }

        ++cycles;
        handle.setState(RunState::Dispatching);
        log::info("Run {}: dispatching {} tool call(s)", handle.runId(), turn->calls.size());

        if (auto dispatched = dispatch(handle, turn->calls); !dispatched)
            return fail(handle, dispatched.error(), cycles);
    }
}

auto AgentLoop::modelTurn(RunHandle& handle) -> Result<ModelTurnResult>
{
    auto attempt = 0;
    while (true)
    {
        auto appended = false;
        auto turn = streamOnce(handle, appended);
        if (turn)
            return turn;

        if (handle.isCancelRequested())
            return makeError(ErrorCode::Cancelled, "Run cancelled");

        auto const& error = turn.error();
        if (!isTransient(error) || appended || attempt >= _config.modelRetries)
            return turn;

        ++attempt;
        log::warning("Model call failed: {}; retrying ({}/{})", error, attempt, _config.modelRetries);
    }
}

auto AgentLoop::streamOnce(RunHandle& handle, bool& appended) -> Result<ModelTurnResult>
{
    auto const request = ModelRequest {
        .systemPrompt = _state.systemPrompt(),
        .transcript = _state.snapshot(),
        .tools = _registry.list(),
    };

    auto stream = _model.completeStream(request, handle.stopToken());
    if (!stream)
        return std::unexpected(stream.error());

    auto turn = ModelTurnResult {};
    auto held = std::string {}; // leading whitespace, not worth a message of its own

    while (true)
    {
        if (handle.isCancelRequested())
            return makeError(ErrorCode::Cancelled, "Run cancelled");

        auto event = (*stream)->next();
        if (!event)
            return std::unexpected(event.error());

        if (auto* delta = std::get_if<TextDelta>(&*event))
        {
            if (!turn.messageIndex)
            {
                held += delta->text;
                if (isBlank(held))
                    continue;

                auto index = _state.beginAssistantMessage();
                if (!index)
                    return std::unexpected(index.error());
                turn.messageIndex = *index;
                appended = true;
                delta->text = std::exchange(held, {});
            }

            if (auto ok = _state.appendAssistantText(*turn.messageIndex, delta->text); !ok)
                return std::unexpected(ok.error());
            turn.text += delta->text;
            _broker.publish(handle.runId(),
                            AssistantDelta { .turnIndex = *turn.messageIndex, .text = std::move(delta->text) });
        }
        else if (auto* directive = std::get_if<ToolCallDirective>(&*event))
        {
            log::debug("Model requested tool '{}'", directive->call.name);
            turn.calls.push_back(std::move(directive->call));
        }
        else
        {
            break;
        }
    }

    if (turn.messageIndex)
    {
        if (auto ok = _state.finishAssistantMessage(*turn.messageIndex); !ok)
            return std::unexpected(ok.error());
    }
    else if (turn.calls.empty())
    {
        // A final answer always ends the transcript with an assistant message, even an empty one.
        turn.text = std::move(held);
        turn.messageIndex = _state.appendAssistantMessage(turn.text);
    }

    return turn;
}

auto AgentLoop::appendCalls(RunHandle& handle, std::vector<ToolCall>& calls, std::set<std::string>& usedIds)
    -> VoidResult
{
    for (auto& call: calls)
    {
        if (call.id.empty() || usedIds.contains(call.id))
            call.id = std::format("call_{}_{}", handle.runId(), usedIds.size() + 1);
        usedIds.insert(call.id);

        if (auto appended = _state.appendToolCall(call); !appended)
            return std::unexpected(appended.error());
    }
    return {};
}

auto AgentLoop::dispatch(RunHandle& handle, const std::vector<ToolCall>& calls) -> VoidResult
{
    auto results = std::vector<ToolResult>(calls.size());
    auto workers = std::vector<std::jthread> {};
    workers.reserve(calls.size());

    for (auto i = std::size_t { 0 }; i < calls.size(); ++i)
    {
        auto invocation = ToolInvocation {
            .id = calls[i].id,
            .toolName = calls[i].name,
            .arguments = calls[i].arguments,
            .startedAt = std::chrono::steady_clock::now(),
            .stopToken = handle.stopToken(),
        };
        handle.addInvocation(invocation);
        _broker.publish(handle.runId(), ToolCallStarted { .call = calls[i] });

        workers.emplace_back([this, &results, i, invocation = std::move(invocation)] {
            results[i] = _executor.execute(invocation);
        });
    }

    // Results are appended in emission order, whatever order the tools complete in.
    for (auto i = std::size_t { 0 }; i < calls.size(); ++i)
    {
        workers[i].join();
        auto& result = results[i];

        if (handle.isCancelRequested() && result.isError() && result.errorCode == ErrorCode::Cancelled)
        {
            if (auto marked = _state.markCancelled(calls[i].id); !marked)
                return marked;
            continue;
        }

        log::debug("Tool '{}' (id: {}) -> {} in {}ms",
                   calls[i].name,
                   result.callId,
                   toolStatusToString(result.status),
                   result.duration.count());

        if (auto appended = _state.appendToolResult(result); !appended)
            return std::unexpected(appended.error());

        _broker.publish(handle.runId(),
                        ToolResultAppended { .toolName = calls[i].name,
                                             .arguments = calls[i].arguments,
                                             .result = std::move(result) });
    }

    if (handle.isCancelRequested())
        return makeError(ErrorCode::Cancelled, "Run cancelled");
    return {};
}

auto AgentLoop::fail(RunHandle& handle, Error error, int cycles) -> RunOutcome
{
    auto const unresolved = _state.resolvePending();
    if (unresolved > 0)
        log::debug("Run {}: {} tool call(s) marked cancelled", handle.runId(), unresolved);

    if (error.code == ErrorCode::Cancelled)
        log::info("Run {} cancelled", handle.runId());
    else
        log::error("Run {} failed: {}", handle.runId(), error);

    handle.setState(RunState::Failed);
    _broker.publish(handle.runId(), RunFailed { .error = error });

    return RunOutcome {
        .runId = handle.runId(),
        .state = RunState::Failed,
        .finalText = {},
        .cycles = cycles,
        .error = std::move(error),
    };
}

} // namespace agentshell
