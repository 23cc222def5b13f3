// SPDX-License-Identifier: Apache-2.0
#include <agentshell/Console.hpp>
#include <agentshell/Panes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace agentshell;
using namespace std::chrono_literals;

namespace
{

auto event(StreamPayload payload) -> StreamEvent
{
    return StreamEvent { .sequence = 0, .runId = 1, .payload = std::move(payload) };
}

auto readFileCall() -> ToolCall
{
    return ToolCall { .id = "c1", .name = "read_file", .arguments = { { "path", "a.txt" } } };
}

} // namespace

TEST_CASE("Console::writeLines prefixes every line", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);

    console.writeLines("> ", "one\ntwo");
    console.writeLines("> ", "three\n");
    console.writeLines("> ", "");
    console.println("{}-{}", 1, 2);

    CHECK(out.str() == "> one\n> two\n> three\n1-2\n");
}

TEST_CASE("ChatPane renders a run with a tool cycle", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);
    auto pane = ChatPane(console);

    auto result = ToolResult::success("c1", "file body");
    result.duration = 12ms;

    pane.render(event(AssistantDelta { .turnIndex = 1, .text = "Hel" }));
    pane.render(event(AssistantDelta { .turnIndex = 1, .text = "lo" }));
    pane.render(event(ToolCallStarted { .call = readFileCall() }));
    pane.render(event(ToolResultAppended { .toolName = "read_file", .arguments = readFileCall().arguments, .result = result }));
    pane.render(event(RunFinished { .finalText = "Hello", .cycles = 1 }));

    CHECK(out.str()
          == "assistant> Hello\n"
             "  -> read_file {\"path\":\"a.txt\"}\n"
             "  <- read_file: ok (12ms)\n"
             "  (done after 1 tool cycle)\n");
}

TEST_CASE("ChatPane renders failures", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);
    auto pane = ChatPane(console);

    SECTION("cancellation ends the open message")
    {
        pane.render(event(AssistantDelta { .turnIndex = 1, .text = "partial" }));
        pane.render(event(RunFailed { .error = Error { ErrorCode::Cancelled, "cancelled by user" } }));
        CHECK(out.str() == "assistant> partial\n  (cancelled)\n");
    }

    SECTION("errors are shown with their code")
    {
        pane.render(event(RunFailed { .error = Error { ErrorCode::ModelError, "boom" } }));
        CHECK(out.str() == "error> [ModelError] boom\n");
    }

    SECTION("failed tool results")
    {
        pane.render(event(ToolResultAppended {
            .toolName = "read_file",
            .arguments = readFileCall().arguments,
            .result = ToolResult::failure("c1", Error { ErrorCode::NotFound, "no such file" }),
        }));
        CHECK(out.str() == "  <- read_file: Error [NotFound]: no such file\n");
    }
}

TEST_CASE("EditorPane previews file tool results", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);
    auto pane = EditorPane(console, 2);

    SECTION("read_file shows the first lines")
    {
        pane.render(event(ToolResultAppended {
            .toolName = "read_file",
            .arguments = readFileCall().arguments,
            .result = ToolResult::success("c1", "one\ntwo\nthree\n"),
        }));
        CHECK(out.str()
              == "[editor] read_file a.txt: ok (0ms)\n"
                 "[editor] one\n"
                 "[editor] two\n"
                 "[editor] ... (1 more lines)\n");
    }

    SECTION("failed writes show only the error")
    {
        pane.render(event(ToolResultAppended {
            .toolName = "write_file",
            .arguments = { { "path", "../x" }, { "content", "data" } },
            .result = ToolResult::failure("c2", Error { ErrorCode::AccessDenied, "outside workspace" }),
        }));
        CHECK(out.str() == "[editor] write_file ../x: Error [AccessDenied]: outside workspace\n");
    }

    SECTION("other tools are ignored")
    {
        pane.render(event(ToolResultAppended {
            .toolName = "terminal_exec",
            .arguments = { { "command", "ls" } },
            .result = ToolResult::success("c3", "a.txt\n"),
        }));
        pane.render(event(AssistantDelta { .turnIndex = 1, .text = "text" }));
        CHECK(out.str().empty());
    }
}

TEST_CASE("TerminalPane shows commands and their output", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);
    auto pane = TerminalPane(console);

    auto const command = nlohmann::json { { "command", "make test" } };
    auto result = ToolResult::failure("t1", Error { ErrorCode::ToolExecutionError, "exit code 2" });
    result.payload = "out\n";

    pane.render(event(ToolCallStarted { .call = ToolCall { .id = "t1", .name = "terminal_exec", .arguments = command } }));
    pane.render(event(ToolCallStarted { .call = readFileCall() }));
    pane.render(event(ToolResultAppended { .toolName = "terminal_exec", .arguments = command, .result = result }));

    CHECK(out.str()
          == "[terminal] $ make test\n"
             "[terminal] out\n"
             "[terminal] Error [ToolExecutionError]: exit code 2\n");
}

TEST_CASE("Pane renders broker events on its own thread", "[console]")
{
    auto out = std::ostringstream {};
    auto console = Console(out);
    auto broker = StreamBroker {};
    auto pane = ChatPane(console);

    pane.start(broker);
    CHECK(broker.subscriberCount() == 1);

    (void) broker.publish(7, AssistantDelta { .turnIndex = 1, .text = "hi" });
    (void) broker.publish(7, RunFinished { .finalText = "hi", .cycles = 0 });

    // stop() drains what is already buffered before joining
    pane.stop();
    pane.stop();

    CHECK(broker.subscriberCount() == 0);
    CHECK(out.str() == "assistant> hi\n");
}
