// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/Turn.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/ToolDefinition.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace agentshell
{

/// @brief A chunk of assistant text.
struct TextDelta
{
    std::string text;
};

/// @brief A complete tool call requested by the model. Arguments are final.
struct ToolCallDirective
{
    ToolCall call;
};

/// @brief The model has finished its turn.
struct EndOfTurn
{
};

using ModelEvent = std::variant<TextDelta, ToolCallDirective, EndOfTurn>;

/// @brief Everything the model sees for one completion: the prompt, the transcript and the tool catalog.
struct ModelRequest
{
    std::string systemPrompt;
    std::vector<Turn> transcript;
    std::vector<ToolDefinition> tools;
};

/// @brief A lazily produced model response.
///
/// next() yields events until EndOfTurn; a stream cannot be restarted, a new completion
/// re-sends the full transcript.
class ModelStream
{
  public:
    virtual ~ModelStream() = default;

    /// @brief Produces the next event.
    /// @return The event, Cancelled once the request's stop token fires, or ModelError.
    [[nodiscard]] virtual auto next() -> Result<ModelEvent> = 0;
};

/// @brief The model collaborator the agent loop talks to.
class ModelClient
{
  public:
    virtual ~ModelClient() = default;

    /// @brief Starts a streamed completion.
    /// @param request The prompt, transcript and tools.
    /// @param stopToken Cancels the completion; the stream then reports Cancelled.
    [[nodiscard]] virtual auto completeStream(const ModelRequest& request, std::stop_token stopToken)
        -> Result<std::unique_ptr<ModelStream>> = 0;
};

} // namespace agentshell
