// SPDX-License-Identifier: Apache-2.0
#include <agent/AgentLoop.hpp>
#include <agent/RunHandle.hpp>
#include <conversation/ConversationState.hpp>
#include <stream/StreamBroker.hpp>
#include <tools/ToolRegistry.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <future>
#include <set>

using namespace agentshell;
using namespace agentshell::testing;
using namespace std::chrono_literals;

namespace
{

struct Fixture
{
    ConversationState state { "You are a test assistant." };
    ToolRegistry registry;
    StreamBroker broker { 1024 };
    std::shared_ptr<Subscription> events = broker.subscribe("test");

    auto runWith(ModelClient& model, AgentConfig config = {}) -> RunOutcome
    {
        auto loop = AgentLoop(state, registry, model, broker, config);
        auto handle = RunHandle(state.currentRun());
        return loop.run(handle);
    }

    auto submit(std::string text) -> void
    {
        (void) state.beginRun();
        (void) state.appendUserMessage(std::move(text));
    }

    auto drainEvents() -> std::vector<StreamEvent>
    {
        auto result = std::vector<StreamEvent> {};
        while (auto event = events->tryNext())
            result.push_back(std::move(*event));
        return result;
    }
};

template <typename T>
auto countTurns(const std::vector<Turn>& turns) -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(turns, [](const Turn& t) { return std::holds_alternative<T>(t); }));
}

} // namespace

TEST_CASE("AgentLoop finishes without tools when the model answers directly", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { text("Hello"), text(", world") } });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    CHECK(outcome.succeeded());
    CHECK(outcome.finalText == "Hello, world");
    CHECK(outcome.cycles == 0);

    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 2);
    auto const& message = std::get<AssistantMessage>(turns[1]);
    CHECK(message.text == "Hello, world");
    CHECK(message.finished);

    auto const events = fixture.drainEvents();
    REQUIRE(events.size() == 3);
    CHECK(std::holds_alternative<AssistantDelta>(events[0].payload));
    CHECK(std::holds_alternative<AssistantDelta>(events[1].payload));
    CHECK(std::holds_alternative<RunFinished>(events[2].payload));
}

TEST_CASE("AgentLoop runs a tool and feeds the result back to the model", "[agent]")
{
    auto fixture = Fixture {};
    auto handler = std::make_shared<RecordingHandler>("exit code 0\nmain.cpp\nutil.cpp");
    REQUIRE(fixture.registry.registerTool(
        makeTool("terminal_exec", handler, { ToolParameter { "command", "string", "", true } })));

    auto model = ScriptedModelClient({
        { call("c1", "terminal_exec", { { "command", "ls ./src" } }) },
        { text("The directory contains main.cpp and util.cpp.") },
    });

    fixture.submit("list files in ./src");
    auto const outcome = fixture.runWith(model);

    REQUIRE(outcome.succeeded());
    CHECK(outcome.cycles == 1);
    CHECK(handler->invocations() == 1);
    CHECK(model.callCount() == 2);

    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 4);
    CHECK(std::holds_alternative<UserMessage>(turns[0]));
    CHECK(std::get<ToolCallTurn>(turns[1]).call.name == "terminal_exec");
    CHECK(std::get<ToolResultTurn>(turns[2]).result.payload == "exit code 0\nmain.cpp\nutil.cpp");
    CHECK(std::get<AssistantMessage>(turns[3]).finished);
    CHECK(fixture.state.isSettled());

    // The second completion saw the result.
    auto const requests = model.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].transcript.size() == 3);
    CHECK(std::holds_alternative<ToolResultTurn>(requests[1].transcript.back()));
    CHECK(requests[0].tools.size() == 1);
}

TEST_CASE("AgentLoop appends results in emission order regardless of completion order", "[agent]")
{
    auto fixture = Fixture {};
    REQUIRE(fixture.registry.registerTool(makeTool("slow", std::make_shared<RecordingHandler>("slow", 150ms))));
    REQUIRE(fixture.registry.registerTool(makeTool("medium", std::make_shared<RecordingHandler>("medium", 60ms))));
    REQUIRE(fixture.registry.registerTool(makeTool("fast", std::make_shared<RecordingHandler>("fast"))));

    auto model = ScriptedModelClient({
        { call("a", "slow"), call("b", "medium"), call("c", "fast") },
        { text("done") },
    });

    fixture.submit("go");
    auto const started = std::chrono::steady_clock::now();
    auto const outcome = fixture.runWith(model);
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.succeeded());
    // Concurrent dispatch: well below the 210ms sequential sum.
    CHECK(elapsed < 1000ms);

    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 8);
    CHECK(std::get<ToolResultTurn>(turns[4]).result.callId == "a");
    CHECK(std::get<ToolResultTurn>(turns[5]).result.callId == "b");
    CHECK(std::get<ToolResultTurn>(turns[6]).result.callId == "c");
    CHECK(std::get<ToolResultTurn>(turns[4]).result.payload == "slow");

    auto order = std::vector<std::string> {};
    for (const auto& event: fixture.drainEvents())
    {
        if (auto const* appended = std::get_if<ToolResultAppended>(&event.payload))
            order.push_back(appended->result.callId);
    }
    CHECK(order == std::vector<std::string> { "a", "b", "c" });
}

TEST_CASE("AgentLoop stops after exactly the configured number of tool cycles", "[agent]")
{
    auto fixture = Fixture {};
    auto handler = std::make_shared<RecordingHandler>();
    REQUIRE(fixture.registry.registerTool(makeTool("again", handler)));

    // Always asks for another tool.
    auto model = ScriptedModelClient({ { call("", "again") } });

    fixture.submit("loop forever");
    auto const outcome = fixture.runWith(model, AgentConfig { .maxIterations = 3, .modelRetries = 1 });

    REQUIRE(!outcome.succeeded());
    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::IterationLimitExceeded);
    CHECK(outcome.cycles == 3);
    CHECK(handler->invocations() == 3);
    CHECK(model.callCount() == 4);

    auto const turns = fixture.state.snapshot();
    CHECK(countTurns<ToolCallTurn>(turns) == 4);
    CHECK(countTurns<ToolResultTurn>(turns) == 3);
    CHECK(std::get<ToolCallTurn>(turns.back()).cancelled);
    CHECK(fixture.state.isSettled());

    auto const events = fixture.drainEvents();
    REQUIRE(!events.empty());
    auto const* failed = std::get_if<RunFailed>(&events.back().payload);
    REQUIRE(failed);
    CHECK(failed->error.code == ErrorCode::IterationLimitExceeded);
}

TEST_CASE("AgentLoop with a zero iteration limit never dispatches", "[agent]")
{
    auto fixture = Fixture {};
    auto handler = std::make_shared<RecordingHandler>();
    REQUIRE(fixture.registry.registerTool(makeTool("tool", handler)));

    auto model = ScriptedModelClient({ { call("x", "tool") } });
    fixture.submit("hi");
    auto const outcome = fixture.runWith(model, AgentConfig { .maxIterations = 0, .modelRetries = 0 });

    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::IterationLimitExceeded);
    CHECK(handler->invocations() == 0);
}

TEST_CASE("AgentLoop assigns unique ids to calls with missing or repeated ids", "[agent]")
{
    auto fixture = Fixture {};
    REQUIRE(fixture.registry.registerTool(makeTool("t", std::make_shared<RecordingHandler>())));

    auto model = ScriptedModelClient({
        { call("dup", "t"), call("dup", "t"), call("", "t") },
        { text("ok") },
    });

    fixture.submit("go");
    REQUIRE(fixture.runWith(model).succeeded());

    auto ids = std::set<std::string> {};
    for (const auto& turn: fixture.state.snapshot())
    {
        if (auto const* callTurn = std::get_if<ToolCallTurn>(&turn))
            ids.insert(callTurn->call.id);
    }
    CHECK(ids.size() == 3);
    CHECK(ids.contains("dup"));
}

TEST_CASE("AgentLoop retries a transient model failure once", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({
        { fault(ErrorCode::ModelError, "backend hiccup") },
        { text("recovered") },
    });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    CHECK(outcome.succeeded());
    CHECK(outcome.finalText == "recovered");
    CHECK(model.callCount() == 2);
}

TEST_CASE("AgentLoop gives up after the retry budget", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { fault(ErrorCode::ModelError) } });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::ModelError);
    CHECK(model.callCount() == 2);
}

TEST_CASE("AgentLoop does not retry once the model produced output", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { text("partial"), fault(ErrorCode::ModelError) } });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::ModelError);
    CHECK(model.callCount() == 1);

    // The partial message is closed, never left streaming.
    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 2);
    CHECK(std::get<AssistantMessage>(turns[1]).text == "partial");
    CHECK(std::get<AssistantMessage>(turns[1]).finished);
    CHECK(fixture.state.isSettled());
}

TEST_CASE("AgentLoop does not retry non-transient model failures", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { fault(ErrorCode::InvalidArgument) } });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::InvalidArgument);
    CHECK(model.callCount() == 1);
}

TEST_CASE("AgentLoop reports invalid arguments back to the model without running the tool", "[agent]")
{
    auto fixture = Fixture {};
    auto handler = std::make_shared<RecordingHandler>();
    REQUIRE(fixture.registry.registerTool(
        makeTool("needs_path", handler, { ToolParameter { "path", "string", "", true } })));

    auto model = ScriptedModelClient({
        { call("c1", "needs_path", { { "path", 42 } }) },
        { text("sorry") },
    });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    CHECK(outcome.succeeded());
    CHECK(handler->invocations() == 0);

    auto const turns = fixture.state.snapshot();
    auto const& result = std::get<ToolResultTurn>(turns[2]).result;
    CHECK(result.isError());
    CHECK(result.errorCode == ErrorCode::ValidationError);
}

TEST_CASE("AgentLoop treats an unknown tool as a failed call, not a failed run", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({
        { call("c1", "does_not_exist") },
        { text("I could not find that tool.") },
    });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    CHECK(outcome.succeeded());
    auto const turns = fixture.state.snapshot();
    auto const& result = std::get<ToolResultTurn>(turns[2]).result;
    CHECK(result.isError());
    CHECK(result.errorCode == ErrorCode::ValidationError);
}

TEST_CASE("AgentLoop cancellation during dispatch leaves no pending calls", "[agent]")
{
    auto fixture = Fixture {};
    auto handler = std::make_shared<RecordingHandler>("never", 10s);
    REQUIRE(fixture.registry.registerTool(makeTool("block", handler)));

    auto model = ScriptedModelClient({ { call("a", "block"), call("b", "block") }, { text("unreachable") } });

    fixture.submit("hi");
    auto loop = AgentLoop(fixture.state, fixture.registry, model, fixture.broker, AgentConfig {});
    auto handle = RunHandle(fixture.state.currentRun());

    auto future = std::async(std::launch::async, [&] { return loop.run(handle); });
    while (handler->invocations() < 2)
        std::this_thread::sleep_for(5ms);

    auto const started = std::chrono::steady_clock::now();
    CHECK(handle.requestCancel());
    auto const outcome = future.get();
    CHECK(std::chrono::steady_clock::now() - started < 2s);

    CHECK(outcome.wasCancelled());
    CHECK(handle.state() == RunState::Failed);
    CHECK(model.callCount() == 1);
    CHECK(fixture.state.pendingToolCalls().empty());
    CHECK(fixture.state.isSettled());

    auto const turns = fixture.state.snapshot();
    CHECK(countTurns<ToolResultTurn>(turns) == 0);
    CHECK(std::get<ToolCallTurn>(turns[1]).cancelled);
    CHECK(std::get<ToolCallTurn>(turns[2]).cancelled);
    CHECK(handle.invocationIds() == std::vector<std::string> { "a", "b" });
}

TEST_CASE("AgentLoop cancellation during a model turn", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { text("thinking"), hang() } });

    fixture.submit("hi");
    auto loop = AgentLoop(fixture.state, fixture.registry, model, fixture.broker, AgentConfig {});
    auto handle = RunHandle(fixture.state.currentRun());

    auto future = std::async(std::launch::async, [&] { return loop.run(handle); });
    while (fixture.state.size() < 2)
        std::this_thread::sleep_for(5ms);

    (void) handle.requestCancel();
    auto const outcome = future.get();

    CHECK(outcome.wasCancelled());
    CHECK(model.callCount() == 1);
    CHECK(fixture.state.isSettled());
    CHECK(std::get<AssistantMessage>(fixture.state.snapshot()[1]).finished);

    auto const events = fixture.drainEvents();
    REQUIRE(!events.empty());
    auto const* failed = std::get_if<RunFailed>(&events.back().payload);
    REQUIRE(failed);
    CHECK(failed->error.code == ErrorCode::Cancelled);
}

TEST_CASE("AgentLoop always ends a final answer with an assistant message", "[agent]")
{
    auto fixture = Fixture {};
    auto model = ScriptedModelClient({ { text("  \n") } });

    fixture.submit("hi");
    auto const outcome = fixture.runWith(model);

    CHECK(outcome.succeeded());
    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 2);
    CHECK(std::get<AssistantMessage>(turns[1]).finished);
}
