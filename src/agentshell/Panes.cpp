// SPDX-License-Identifier: Apache-2.0
#include "Panes.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <algorithm>
#include <format>

namespace agentshell
{

namespace
{
    constexpr auto FileTools =
        std::array<std::string_view, 5> { "read_file", "write_file", "patch_file", "replace_in_file", "insert_in_file" };
    constexpr auto TerminalToolName = std::string_view { "terminal_exec" };

    /// @brief Returns at most `maxLines` lines of `text`, noting how many were left out.
    auto firstLines(std::string_view text, std::size_t maxLines) -> std::string
    {
        auto result = std::string {};
        auto lines = std::size_t { 0 };
        auto pos = std::size_t { 0 };
        while (pos < text.size() && lines < maxLines)
        {
            auto end = text.find('\n', pos);
            if (end == std::string_view::npos)
                end = text.size();
            result.append(text.substr(pos, end - pos)).push_back('\n');
            ++lines;
            pos = end + 1;
        }
        if (pos < text.size())
        {
            auto const rest = std::ranges::count(text.substr(pos), '\n') + (text.back() == '\n' ? 0 : 1);
            result += std::format("... ({} more lines)\n", rest);
        }
        return result;
    }

    auto describeResult(const ToolResult& result) -> std::string
    {
        if (!result.isError())
            return std::format("ok ({}ms)", result.duration.count());
        return std::format("Error [{}]: {}", errorCodeName(result.errorCode), result.errorDetail);
    }
} // namespace

Pane::Pane(std::string name, Console& console): _name(std::move(name)), _console(console)
{
}

Pane::~Pane()
{
    stop();
}

void Pane::start(StreamBroker& broker, std::optional<std::size_t> capacity)
{
    stop();
    _broker = &broker;
    _subscription = broker.subscribe(_name, capacity);
    _worker = std::jthread([this, subscription = _subscription](std::stop_token stopToken) {
        while (auto event = subscription->next(stopToken))
            render(*event);
    });
}

void Pane::stop()
{
    if (_broker && _subscription)
        _broker->unsubscribe(_subscription);

    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }
    _subscription.reset();
    _broker = nullptr;
}

ChatPane::ChatPane(Console& console): Pane("chat", console)
{
}

ChatPane::~ChatPane()
{
    stop();
}

void ChatPane::render(const StreamEvent& event)
{
    if (auto const* delta = std::get_if<AssistantDelta>(&event.payload))
    {
        console().write(_inMessage ? delta->text : "assistant> " + delta->text);
        _inMessage = true;
    }
    else if (auto const* started = std::get_if<ToolCallStarted>(&event.payload))
    {
        endMessage();
        console().println("  -> {} {}", started->call.name, started->call.arguments.dump());
    }
    else if (auto const* appended = std::get_if<ToolResultAppended>(&event.payload))
    {
        endMessage();
        console().println("  <- {}: {}", appended->toolName, describeResult(appended->result));
    }
    else if (auto const* finished = std::get_if<RunFinished>(&event.payload))
    {
        endMessage();
        if (finished->cycles > 0)
            console().println("  (done after {} tool cycle{})", finished->cycles, finished->cycles == 1 ? "" : "s");
    }
    else if (auto const* failed = std::get_if<RunFailed>(&event.payload))
    {
        endMessage();
        if (failed->error.code == ErrorCode::Cancelled)
            console().println("  (cancelled)");
        else
            console().println("error> {}", failed->error);
    }
}

void ChatPane::endMessage()
{
    if (!_inMessage)
        return;
    console().write("\n");
    _inMessage = false;
}

EditorPane::EditorPane(Console& console, std::size_t previewLines): Pane("editor", console), _previewLines(previewLines)
{
}

EditorPane::~EditorPane()
{
    stop();
}

void EditorPane::render(const StreamEvent& event)
{
    auto const* appended = std::get_if<ToolResultAppended>(&event.payload);
    if (!appended || std::ranges::find(FileTools, appended->toolName) == FileTools.end())
        return;

    auto const& args = appended->arguments;
    auto const path = json::getStringOr(args, "path", "?");
    auto text = std::format("{} {}: {}\n", appended->toolName, path, describeResult(appended->result));

    if (!appended->result.isError())
    {
        if (appended->toolName == "read_file")
            text += firstLines(appended->result.payload, _previewLines);
        else if (appended->toolName == "write_file")
            text += firstLines(json::getStringOr(args, "content", ""), _previewLines);
        else if (appended->toolName == "patch_file")
            text += firstLines(json::getStringOr(args, "diff", ""), _previewLines);
        else if (appended->toolName == "insert_in_file")
            text += firstLines(std::format("+ {}", json::getStringOr(args, "new_text", "")), _previewLines);
        else
            text += firstLines(std::format("- {}\n+ {}", json::getStringOr(args, "old_text", ""),
                                           json::getStringOr(args, "new_text", "")),
                               _previewLines);
    }

    console().writeLines("[editor] ", text);
}

TerminalPane::TerminalPane(Console& console, std::size_t maxLines): Pane("terminal", console), _maxLines(maxLines)
{
}

TerminalPane::~TerminalPane()
{
    stop();
}

void TerminalPane::render(const StreamEvent& event)
{
    if (auto const* started = std::get_if<ToolCallStarted>(&event.payload))
    {
        if (started->call.name == TerminalToolName)
            console().writeLines("[terminal] ", "$ " + json::getStringOr(started->call.arguments, "command", ""));
        return;
    }

    auto const* appended = std::get_if<ToolResultAppended>(&event.payload);
    if (!appended || appended->toolName != TerminalToolName)
        return;

    auto const& result = appended->result;
    auto text = firstLines(result.payload, _maxLines);
    if (result.isError())
        text += std::format("{}\n", describeResult(result));
    console().writeLines("[terminal] ", text);
}

} // namespace agentshell
