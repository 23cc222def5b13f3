// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ModelClient.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace agentshell
{

/// @brief Splits streamed model output into text deltas and `<tool_call>{...}</tool_call>` blocks.
///
/// Text that could be the start of an opening tag is held back until it is disambiguated,
/// and a tool call is only emitted once its closing tag has arrived, so partial arguments
/// never leave the parser. Emitted calls carry no id; the caller assigns one.
class ToolCallParser
{
  public:
    /// @brief Consumes a piece of generated text.
    /// @return The events that became complete.
    [[nodiscard]] auto feed(std::string_view piece) -> std::vector<ModelEvent>;

    /// @brief Flushes held-back text at the end of generation.
    ///
    /// An unterminated tool call block is returned as plain text.
    [[nodiscard]] auto finish() -> std::vector<ModelEvent>;

    /// @brief True while inside an unterminated tool call block.
    [[nodiscard]] auto insideToolCall() const -> bool { return _inside; }

  private:
    std::string _buffer;
    bool _inside = false;

    void emitText(std::vector<ModelEvent>& events, std::string_view text);
    void emitCall(std::vector<ModelEvent>& events, std::string_view body);
};

} // namespace agentshell
