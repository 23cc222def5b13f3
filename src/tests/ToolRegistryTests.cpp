// SPDX-License-Identifier: Apache-2.0
#include <tools/ToolExecutor.hpp>
#include <tools/ToolRegistry.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <stdexcept>

using namespace agentshell;
using namespace agentshell::testing;
using namespace std::chrono_literals;

namespace
{

auto remoteTool(std::string name, std::shared_ptr<ToolHandler> handler) -> ToolDefinition
{
    auto definition = makeTool(std::move(name), std::move(handler));
    definition.allowAdditionalArguments = true;
    return definition;
}

/// @brief Throws from invoke(), as a buggy handler might.
class ThrowingHandler: public ToolHandler
{
  public:
    auto invoke(const nlohmann::json&, std::stop_token) -> Result<ToolOutput> override
    {
        throw std::runtime_error("boom");
    }
};

/// @brief Reports a failed operation together with its captured output.
class FailingHandler: public ToolHandler
{
  public:
    auto invoke(const nlohmann::json&, std::stop_token) -> Result<ToolOutput> override
    {
        return ToolOutput { .text = "partial output", .failed = true, .failureDetail = "exit code 2" };
    }
};

auto invocation(std::string id, std::string tool, nlohmann::json args = nlohmann::json::object(), std::stop_token stop = {})
    -> ToolInvocation
{
    return ToolInvocation {
        .id = std::move(id),
        .toolName = std::move(tool),
        .arguments = std::move(args),
        .startedAt = std::chrono::steady_clock::now(),
        .stopToken = std::move(stop),
    };
}

} // namespace

TEST_CASE("ToolRegistry registers and looks up tools in order", "[tools]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("alpha", std::make_shared<RecordingHandler>())));
    REQUIRE(registry.registerTool(makeTool("beta", std::make_shared<RecordingHandler>())));

    CHECK(registry.size() == 2);
    CHECK(registry.contains("alpha"));
    CHECK(registry.lookup("beta").has_value());

    auto const tools = registry.list();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].name == "alpha");
    CHECK(tools[1].name == "beta");

    auto const missing = registry.lookup("gamma");
    REQUIRE(!missing);
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("ToolRegistry rejects duplicate and incomplete definitions", "[tools]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("alpha", std::make_shared<RecordingHandler>())));

    auto const duplicate = registry.registerTool(makeTool("alpha", std::make_shared<RecordingHandler>()));
    REQUIRE(!duplicate);
    CHECK(duplicate.error().code == ErrorCode::DuplicateName);

    auto const incomplete = registry.registerTool(makeTool("beta", nullptr));
    REQUIRE(!incomplete);
    CHECK(incomplete.error().code == ErrorCode::InvalidArgument);
    CHECK(registry.size() == 1);
}

TEST_CASE("ToolRegistry registers a server's tools all or nothing", "[tools]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("search", std::make_shared<RecordingHandler>())));

    auto batch = std::vector<ToolDefinition> {
        remoteTool("fetch", std::make_shared<RecordingHandler>()),
        remoteTool("search", std::make_shared<RecordingHandler>()),
    };
    auto const rejected = registry.registerServer("web", std::move(batch));
    REQUIRE(!rejected);
    CHECK(rejected.error().code == ErrorCode::DuplicateName);
    CHECK(!registry.contains("fetch"));

    auto selfColliding = std::vector<ToolDefinition> {
        remoteTool("x", std::make_shared<RecordingHandler>()),
        remoteTool("x", std::make_shared<RecordingHandler>()),
    };
    CHECK(!registry.registerServer("dup", std::move(selfColliding)));
    CHECK(!registry.contains("x"));

    auto good = std::vector<ToolDefinition> {
        remoteTool("fetch", std::make_shared<RecordingHandler>()),
        remoteTool("post", std::make_shared<RecordingHandler>()),
    };
    REQUIRE(registry.registerServer("web", std::move(good)));
    CHECK(registry.size() == 3);
    CHECK(registry.lookup("post")->owner == "web");

    auto const again = registry.registerServer("web", { remoteTool("other", std::make_shared<RecordingHandler>()) });
    REQUIRE(!again);
    CHECK(again.error().code == ErrorCode::DuplicateName);
    CHECK(!registry.contains("other"));

    CHECK(registry.removeServer("web") == 2);
    CHECK(registry.size() == 1);
    CHECK(registry.removeServer("web") == 0);
    CHECK(registry.removeServer("") == 0);
}

TEST_CASE("ToolRegistry removal waits for in-flight invocations", "[tools]")
{
    auto registry = ToolRegistry {};
    auto handler = std::make_shared<RecordingHandler>("slow", 200ms);
    REQUIRE(registry.registerServer("remote", { remoteTool("slow_tool", handler) }));

    auto executor = ToolExecutor(registry);
    auto running = std::async(std::launch::async, [&] { return executor.execute(invocation("1", "slow_tool")); });
    while (handler->invocations() == 0)
        std::this_thread::sleep_for(2ms);

    auto const started = std::chrono::steady_clock::now();
    CHECK(registry.removeServer("remote") == 1);
    CHECK(std::chrono::steady_clock::now() - started >= 100ms);

    auto const result = running.get();
    CHECK(!result.isError());
    CHECK(!registry.contains("slow_tool"));

    auto const after = executor.execute(invocation("2", "slow_tool"));
    CHECK(after.isError());
    CHECK(after.errorCode == ErrorCode::ValidationError);
}

TEST_CASE("ToolExecutor normalizes every outcome into a ToolResult", "[tools]")
{
    auto registry = ToolRegistry {};
    auto handler = std::make_shared<RecordingHandler>("fine");
    REQUIRE(registry.registerTool(makeTool("ok", handler, { ToolParameter { "path", "string", "", true } })));
    REQUIRE(registry.registerTool(makeTool("throws", std::make_shared<ThrowingHandler>())));
    REQUIRE(registry.registerTool(makeTool("fails", std::make_shared<FailingHandler>())));
    auto executor = ToolExecutor(registry);

    SECTION("success")
    {
        auto const result = executor.execute(invocation("1", "ok", { { "path", "a.txt" } }));
        CHECK(!result.isError());
        CHECK(result.callId == "1");
        CHECK(result.payload == "fine");
        CHECK(handler->arguments().front()["path"] == "a.txt");
    }

    SECTION("missing required argument")
    {
        auto const result = executor.execute(invocation("2", "ok"));
        CHECK(result.errorCode == ErrorCode::ValidationError);
        CHECK(handler->invocations() == 0);
    }

    SECTION("undeclared argument")
    {
        auto const result = executor.execute(invocation("3", "ok", { { "path", "a" }, { "extra", 1 } }));
        CHECK(result.errorCode == ErrorCode::ValidationError);
        CHECK(handler->invocations() == 0);
    }

    SECTION("handler exception")
    {
        auto const result = executor.execute(invocation("4", "throws"));
        CHECK(result.errorCode == ErrorCode::ToolExecutionError);
        CHECK(result.errorDetail.find("boom") != std::string::npos);
    }

    SECTION("failed operation keeps its output")
    {
        auto const result = executor.execute(invocation("5", "fails"));
        CHECK(result.isError());
        CHECK(result.errorCode == ErrorCode::ToolExecutionError);
        CHECK(result.payload == "partial output");
        CHECK(result.toModelText() == "Error [ToolExecutionError]: exit code 2\npartial output");
    }

    SECTION("cancelled before start")
    {
        auto source = std::stop_source {};
        source.request_stop();
        auto const result = executor.execute(invocation("6", "ok", { { "path", "a" } }, source.get_token()));
        CHECK(result.errorCode == ErrorCode::Cancelled);
        CHECK(handler->invocations() == 0);
    }
}

TEST_CASE("ToolExecutor runs a tool once per invocation", "[tools]")
{
    auto registry = ToolRegistry {};
    auto handler = std::make_shared<RecordingHandler>();
    REQUIRE(registry.registerTool(makeTool("t", handler)));
    auto executor = ToolExecutor(registry);

    (void) executor.execute(invocation("same", "t"));
    (void) executor.execute(invocation("same", "t"));
    CHECK(handler->invocations() == 2);
}
