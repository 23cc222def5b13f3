// SPDX-License-Identifier: Apache-2.0
#include <session/SessionController.hpp>
#include <stream/StreamBroker.hpp>
#include <tools/ToolRegistry.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace agentshell;
using namespace agentshell::testing;
using namespace std::chrono_literals;

namespace
{

struct SessionFixture
{
    ConversationState state { "system" };
    ToolRegistry registry;
    StreamBroker broker { 256 };
    ScriptedModelClient model;
    AgentLoop loop;
    SessionController session { state, loop };

    explicit SessionFixture(std::vector<Script> scripts):
        model(std::move(scripts)), loop(state, registry, model, broker, AgentConfig {})
    {
    }
};

} // namespace

TEST_CASE("SessionController runs a submitted message to completion", "[session]")
{
    auto fixture = SessionFixture({ { text("Hi!") } });
    CHECK(fixture.session.currentState() == RunState::Idle);
    CHECK(!fixture.session.lastOutcome());

    auto const runId = fixture.session.submit("hello");
    auto const outcome = fixture.session.wait(5s);

    REQUIRE(outcome);
    CHECK(outcome->runId == runId);
    CHECK(outcome->succeeded());
    CHECK(outcome->finalText == "Hi!");
    CHECK(!fixture.session.isRunning());
    CHECK(fixture.session.currentState() == RunState::Done);
    CHECK(fixture.state.size() == 2);
}

TEST_CASE("SessionController cancelCurrent stops a live run", "[session]")
{
    auto fixture = SessionFixture({ { text("working"), hang() } });

    (void) fixture.session.submit("do something long");
    while (fixture.state.size() < 2)
        std::this_thread::sleep_for(5ms);
    CHECK(fixture.session.isRunning());

    auto const outcome = fixture.session.cancelCurrent();
    REQUIRE(outcome);
    CHECK(outcome->wasCancelled());
    CHECK(!fixture.session.isRunning());
    CHECK(fixture.state.isSettled());

    CHECK(!fixture.session.cancelCurrent());
}

TEST_CASE("SessionController submit supersedes the live run", "[session]")
{
    auto handler = std::make_shared<RecordingHandler>("late", 10s);
    auto fixture = SessionFixture({
        { call("a", "block") },
        { text("second answer") },
    });
    REQUIRE(fixture.registry.registerTool(makeTool("block", handler)));

    auto const first = fixture.session.submit("first");
    while (handler->invocations() == 0)
        std::this_thread::sleep_for(5ms);

    auto const second = fixture.session.submit("second");
    CHECK(second == first + 1);

    auto const outcome = fixture.session.wait(5s);
    REQUIRE(outcome);
    CHECK(outcome->runId == second);
    CHECK(outcome->succeeded());
    CHECK(outcome->finalText == "second answer");

    // [user, call(cancelled), user, assistant]
    auto const turns = fixture.state.snapshot();
    REQUIRE(turns.size() == 4);
    CHECK(std::get<ToolCallTurn>(turns[1]).cancelled);
    CHECK(std::get<UserMessage>(turns[2]).text == "second");
    CHECK(fixture.state.isSettled());
}

TEST_CASE("SessionController destructor cancels a live run", "[session]")
{
    auto const started = std::chrono::steady_clock::now();
    {
        auto fixture = SessionFixture({ { hang() } });
        (void) fixture.session.submit("never answered");
        std::this_thread::sleep_for(20ms);
    }
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}
