// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/RunHandle.hpp>
#include <conversation/ConversationState.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ModelClient.hpp>
#include <stream/StreamBroker.hpp>
#include <tools/ToolExecutor.hpp>
#include <tools/ToolRegistry.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief Configuration for the agent loop.
struct AgentConfig
{
    /// @brief Maximum number of ModelTurn -> Dispatching cycles per run.
    int maxIterations = 10;

    /// @brief Automatic retries of a model call that failed transiently before producing output.
    int modelRetries = 1;
};

/// @brief Drives one run: model turn, concurrent tool dispatch, model turn again, until done.
///
/// The loop is an explicit state machine (see RunState). A model turn streams assistant text
/// into the transcript and collects complete tool-call directives; if there are none the run
/// is Done. Otherwise the calls are appended, executed concurrently, and their results are
/// appended in the order the model emitted the calls. Every transition, delta and result is
/// published to the StreamBroker.
class AgentLoop
{
  public:
    /// @brief Constructs an AgentLoop.
    /// @param state The transcript to read from and append to.
    /// @param registry The tools advertised to the model and executed on its behalf.
    /// @param model The model collaborator.
    /// @param broker Receives all run events.
    /// @param config Agent configuration.
    AgentLoop(ConversationState& state,
              const ToolRegistry& registry,
              ModelClient& model,
              StreamBroker& broker,
              AgentConfig config);

    /// @brief Executes a run to completion, failure or cancellation.
    ///
    /// The user message must already be appended. Never throws; the outcome is also stored
    /// in the handle, and the transcript is left without pending calls in every case.
    auto run(RunHandle& handle) -> RunOutcome;

    /// @brief Returns the agent configuration.
    [[nodiscard]] auto config() const -> const AgentConfig&;

  private:
    struct ModelTurnResult
    {
        std::string text;
        std::optional<std::size_t> messageIndex;
        std::vector<ToolCall> calls;
    };

    ConversationState& _state;
    const ToolRegistry& _registry;
    ToolExecutor _executor;
    ModelClient& _model;
    StreamBroker& _broker;
    AgentConfig _config;

    [[nodiscard]] auto drive(RunHandle& handle) -> RunOutcome;
    [[nodiscard]] auto modelTurn(RunHandle& handle) -> Result<ModelTurnResult>;
    [[nodiscard]] auto streamOnce(RunHandle& handle, bool& appended) -> Result<ModelTurnResult>;
    [[nodiscard]] auto appendCalls(RunHandle& handle, std::vector<ToolCall>& calls, std::set<std::string>& usedIds)
        -> VoidResult;
    [[nodiscard]] auto dispatch(RunHandle& handle, const std::vector<ToolCall>& calls) -> VoidResult;
    [[nodiscard]] auto fail(RunHandle& handle, Error error, int cycles) -> RunOutcome;
};

} // namespace agentshell
