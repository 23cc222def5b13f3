// SPDX-License-Identifier: Apache-2.0
#include <conversation/ConversationState.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace agentshell;

namespace
{

auto toolCall(std::string id, std::string name = "tool") -> ToolCall
{
    return ToolCall { .id = std::move(id), .name = std::move(name), .arguments = nlohmann::json::object() };
}

} // namespace

TEST_CASE("ConversationState streams an assistant message", "[conversation]")
{
    auto state = ConversationState("system");
    (void) state.beginRun();
    (void) state.appendUserMessage("hello");

    auto index = state.beginAssistantMessage();
    REQUIRE(index.has_value());
    CHECK(!state.isSettled());

    REQUIRE(state.appendAssistantText(*index, "Hel"));
    REQUIRE(state.appendAssistantText(*index, "lo"));
    REQUIRE(state.finishAssistantMessage(*index));
    CHECK(state.isSettled());

    auto const message = std::get<AssistantMessage>(*state.turnAt(*index));
    CHECK(message.text == "Hello");
    CHECK(message.finished);

    SECTION("a finished message no longer accepts text")
    {
        auto const appended = state.appendAssistantText(*index, "!");
        REQUIRE(!appended);
        CHECK(appended.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConversationState rejects a second streaming message", "[conversation]")
{
    auto state = ConversationState("system");
    REQUIRE(state.beginAssistantMessage().has_value());
    auto const second = state.beginAssistantMessage();
    REQUIRE(!second);
    CHECK(second.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ConversationState pairs tool results with calls of the current run", "[conversation]")
{
    auto state = ConversationState("system");
    (void) state.beginRun();
    REQUIRE(state.appendToolCall(toolCall("a")).has_value());
    REQUIRE(state.appendToolCall(toolCall("b")).has_value());

    CHECK(state.pendingToolCalls() == std::vector<std::string> { "a", "b" });

    REQUIRE(state.appendToolResult(ToolResult::success("b", "B")).has_value());
    CHECK(state.pendingToolCalls() == std::vector<std::string> { "a" });

    SECTION("a result for an unknown call is rejected")
    {
        auto const result = state.appendToolResult(ToolResult::success("zzz", ""));
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::NotFound);
    }

    SECTION("a second result for the same call is rejected")
    {
        auto const result = state.appendToolResult(ToolResult::success("b", "again"));
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("a duplicate call id is rejected")
    {
        auto const result = state.appendToolCall(toolCall("a"));
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::DuplicateName);
    }

    SECTION("a cancelled call cannot get a result afterwards")
    {
        REQUIRE(state.markCancelled("a"));
        CHECK(state.isSettled());
        CHECK(!state.appendToolResult(ToolResult::success("a", "late")));
        CHECK(std::get<ToolCallTurn>(*state.turnAt(0)).cancelled);
    }
}

TEST_CASE("ConversationState call ids are scoped to a run", "[conversation]")
{
    auto state = ConversationState("system");
    (void) state.beginRun();
    REQUIRE(state.appendToolCall(toolCall("call_1")).has_value());
    REQUIRE(state.appendToolResult(ToolResult::success("call_1", "x")).has_value());

    (void) state.beginRun();
    CHECK(state.appendToolCall(toolCall("call_1")).has_value());
}

TEST_CASE("ConversationState resolvePending closes everything open", "[conversation]")
{
    auto state = ConversationState("system");
    (void) state.beginRun();
    REQUIRE(state.appendToolCall(toolCall("a")).has_value());
    REQUIRE(state.appendToolCall(toolCall("b")).has_value());
    REQUIRE(state.appendToolResult(ToolResult::success("a", "A")).has_value());
    REQUIRE(state.beginAssistantMessage().has_value());

    CHECK(state.resolvePending() == 1);
    CHECK(state.isSettled());
    CHECK(state.pendingToolCalls().empty());

    auto const turns = state.snapshot();
    CHECK(!std::get<ToolCallTurn>(turns[0]).cancelled);
    CHECK(std::get<ToolCallTurn>(turns[1]).cancelled);
    CHECK(std::get<AssistantMessage>(turns[3]).finished);
}

TEST_CASE("ConversationState beginRun settles leftovers of the previous run", "[conversation]")
{
    auto state = ConversationState("system");
    auto const first = state.beginRun();
    REQUIRE(state.appendToolCall(toolCall("a")).has_value());

    auto const second = state.beginRun();
    CHECK(second == first + 1);
    CHECK(state.currentRun() == second);
    CHECK(state.isSettled());
    CHECK(std::get<ToolCallTurn>(*state.turnAt(0)).cancelled);
}

TEST_CASE("ConversationState clear keeps the system prompt", "[conversation]")
{
    auto state = ConversationState("be brief");
    (void) state.appendUserMessage("x");
    state.clear();
    CHECK(state.size() == 0);
    CHECK(state.systemPrompt() == "be brief");

    state.setSystemPrompt("be verbose");
    CHECK(state.systemPrompt() == "be verbose");
    CHECK(!state.turnAt(0).has_value());
}
