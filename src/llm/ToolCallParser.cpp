// SPDX-License-Identifier: Apache-2.0
#include "ToolCallParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace agentshell
{

namespace
{
    constexpr auto OpenTag = std::string_view("<tool_call>");
    constexpr auto CloseTag = std::string_view("</tool_call>");

    /// @brief Length of the longest suffix of `text` that is a proper prefix of `tag`.
    auto partialTagLength(std::string_view text, std::string_view tag) -> std::size_t
    {
        for (auto n = std::min(text.size(), tag.size() - 1); n > 0; --n)
        {
            if (text.substr(text.size() - n) == tag.substr(0, n))
                return n;
        }
        return 0;
    }
} // namespace

auto ToolCallParser::feed(std::string_view piece) -> std::vector<ModelEvent>
{
    auto events = std::vector<ModelEvent> {};
    _buffer += piece;

    while (!_buffer.empty())
    {
        if (!_inside)
        {
            auto const open = _buffer.find(OpenTag);
            if (open == std::string::npos)
            {
                auto const held = partialTagLength(_buffer, OpenTag);
                emitText(events, std::string_view(_buffer).substr(0, _buffer.size() - held));
                _buffer.erase(0, _buffer.size() - held);
                break;
            }
            emitText(events, std::string_view(_buffer).substr(0, open));
            _buffer.erase(0, open + OpenTag.size());
            _inside = true;
        }
        else
        {
            auto const close = _buffer.find(CloseTag);
            if (close == std::string::npos)
                break;
            emitCall(events, std::string_view(_buffer).substr(0, close));
            _buffer.erase(0, close + CloseTag.size());
            _inside = false;
        }
    }
    return events;
}

auto ToolCallParser::finish() -> std::vector<ModelEvent>
{
    auto events = std::vector<ModelEvent> {};
    if (_inside)
    {
        log::warning("Model output ended inside an unterminated tool call");
        emitText(events, std::format("{}{}", OpenTag, _buffer));
    }
    else
    {
        emitText(events, _buffer);
    }
    _buffer.clear();
    _inside = false;
    return events;
}

void ToolCallParser::emitText(std::vector<ModelEvent>& events, std::string_view text)
{
    if (text.empty())
        return;

    if (!events.empty())
    {
        if (auto* last = std::get_if<TextDelta>(&events.back()))
        {
            last->text += text;
            return;
        }
    }
    events.emplace_back(TextDelta { .text = std::string(text) });
}

void ToolCallParser::emitCall(std::vector<ModelEvent>& events, std::string_view body)
{
    auto parsed = json::parse(body);
    if (!parsed || !parsed->is_object())
    {
        // Show it to the user rather than dropping it; the model will see it in the transcript too.
        log::warning("Malformed tool call from model: {}", body);
        emitText(events, std::format("{}{}{}", OpenTag, body, CloseTag));
        return;
    }

    auto arguments = parsed->value("arguments", nlohmann::json::object());
    if (arguments.is_string())
    {
        // Some models emit the arguments as a JSON-encoded string.
        if (auto inner = json::parse(arguments.get<std::string>()); inner)
            arguments = std::move(*inner);
    }

    events.emplace_back(ToolCallDirective {
        .call = ToolCall {
            .id = json::getStringOr(*parsed, "id", ""),
            .name = json::getStringOr(*parsed, "name", ""),
            .arguments = std::move(arguments),
        },
    });
}

} // namespace agentshell
