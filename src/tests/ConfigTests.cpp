// SPDX-License-Identifier: Apache-2.0
#include <agentshell/Config.hpp>
#include <core/JsonUtils.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <limits>

using namespace agentshell;
using agentshell::testing::TempDir;

namespace
{

auto requireConfigError(std::string_view content) -> Error
{
    auto result = parseConfig(content);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    return result.error();
}

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    CHECK(!defaultConfigDir().empty());
    CHECK(defaultConfigPath().ends_with("agentshell/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.llm.contextSize == 8192);
    CHECK(config.llm.temperature == 0.7f);
    CHECK(config.agent.maxIterations == 10);
    CHECK(config.agent.modelRetries == 1);
    CHECK(config.agent.systemPrompt.contains("{workspace}"));
    CHECK(config.terminal.timeoutMs == 30000);
    CHECK(!config.terminal.blockedCommands.empty());
    CHECK(config.workspaceRoot.empty());
    CHECK(config.mcpServers.empty());
    CHECK(config.log.level == "info");
}

TEST_CASE("parseConfig of an empty object yields defaults", "[config]")
{
    auto const result = parseConfig("{}");
    REQUIRE(result.has_value());
    CHECK(result->agent.maxIterations == 10);
    CHECK(result->ui.paneBufferSize == 256);
}

TEST_CASE("parseConfig reads every section", "[config]")
{
    auto const result = parseConfig(R"({
        "llm": { "modelPath": "/tmp/test.gguf", "contextSize": 4096, "gpuLayers": 32, "temperature": 0.5 },
        "agent": { "maxIterations": 3, "modelRetries": 0, "systemPrompt": "Work in {workspace}" },
        "workspace": { "root": "/srv/project" },
        "tools": {
            "terminal": { "timeoutMs": 1500, "maxOutputBytes": 1024, "blockedCommands": ["git push"] },
            "files": { "maxReadBytes": 2048 }
        },
        "mcpServers": {
            "test-server": { "command": "echo", "args": ["hello"], "env": { "KEY": "value" } },
            "off": { "command": "true", "enabled": false }
        },
        "ui": { "paneBufferSize": 16 },
        "log": { "level": "debug", "file": "/tmp/agentshell.log" }
    })");
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("LLM")
    {
        CHECK(config.llm.modelPath == "/tmp/test.gguf");
        CHECK(config.llm.contextSize == 4096);
        CHECK(config.llm.gpuLayers == 32);
        CHECK(config.llm.temperature == 0.5f);
    }

    SECTION("agent and workspace")
    {
        CHECK(config.agent.maxIterations == 3);
        CHECK(config.agent.modelRetries == 0);
        CHECK(config.agent.systemPrompt == "Work in {workspace}");
        CHECK(config.workspaceRoot == "/srv/project");
    }

    SECTION("tools")
    {
        CHECK(config.terminal.timeoutMs == 1500);
        CHECK(config.terminal.maxOutputBytes == 1024);
        CHECK(config.terminal.blockedCommands == std::vector<std::string> { "git push" });
        CHECK(config.files.maxReadBytes == 2048);
    }

    SECTION("MCP servers")
    {
        REQUIRE(config.mcpServers.size() == 2);
        auto const& server = config.mcpServers.at("test-server");
        CHECK(server.name == "test-server");
        CHECK(server.command == "echo");
        CHECK(server.args == std::vector<std::string> { "hello" });
        CHECK(server.env.at("KEY") == "value");
        CHECK(server.enabled);
        CHECK(!config.mcpServers.at("off").enabled);
    }

    SECTION("ui and log")
    {
        CHECK(config.ui.paneBufferSize == 16);
        CHECK(config.log.level == "debug");
        CHECK(config.log.file == "/tmp/agentshell.log");
    }
}

TEST_CASE("json::getIntOr saturates integers outside the range of int", "[config][json]")
{
    auto const obj = nlohmann::json {
        { "big", 4294967297LL },
        { "huge", std::numeric_limits<std::uint64_t>::max() },
        { "tiny", -4294967297LL },
        { "plain", 42 },
        { "text", "7" },
    };

    CHECK(json::getIntOr(obj, "big", 0) == std::numeric_limits<int>::max());
    CHECK(json::getIntOr(obj, "huge", 0) == std::numeric_limits<int>::max());
    CHECK(json::getIntOr(obj, "tiny", 0) == std::numeric_limits<int>::min());
    CHECK(json::getIntOr(obj, "plain", 0) == 42);
    CHECK(json::getIntOr(obj, "text", 5) == 5);
    CHECK(json::getIntOr(obj, "missing", 9) == 9);

    auto const result = parseConfig(R"({ "tools": { "terminal": { "timeoutMs": 4294967297 } } })");
    REQUIRE(result.has_value());
    CHECK(result->terminal.timeoutMs == std::numeric_limits<int>::max());
}

TEST_CASE("parseConfig caps modelRetries at one", "[config]")
{
    auto const result = parseConfig(R"({ "agent": { "modelRetries": 5 } })");
    REQUIRE(result.has_value());
    CHECK(result->agent.modelRetries == 1);
}

TEST_CASE("parseConfig rejects invalid settings", "[config]")
{
    SECTION("malformed JSON")
    {
        (void) requireConfigError("{ not json");
    }

    SECTION("non-object root")
    {
        (void) requireConfigError("[1, 2]");
    }

    SECTION("negative iteration limit")
    {
        auto const error = requireConfigError(R"({ "agent": { "maxIterations": -1 } })");
        CHECK(error.message.contains("maxIterations"));
    }

    SECTION("non-positive terminal timeout")
    {
        auto const error = requireConfigError(R"({ "tools": { "terminal": { "timeoutMs": 0 } } })");
        CHECK(error.message.contains("timeoutMs"));
    }

    SECTION("MCP server without command")
    {
        auto const error = requireConfigError(R"({ "mcpServers": { "broken": { "args": [] } } })");
        CHECK(error.message.contains("broken"));
    }

    SECTION("unknown log level")
    {
        auto const error = requireConfigError(R"({ "log": { "level": "loud" } })");
        CHECK(error.message.contains("loud"));
    }
}

TEST_CASE("expandSystemPrompt substitutes every workspace placeholder", "[config]")
{
    CHECK(expandSystemPrompt("root={workspace}; again {workspace}", "/w") == "root=/w; again /w");
    CHECK(expandSystemPrompt("no placeholder", "/w") == "no placeholder");
    CHECK(expandSystemPrompt("{workspace}", "{workspace}") == "{workspace}");
}

TEST_CASE("saveConfigToFile and loadConfigFromFile preserve the configuration", "[config]")
{
    auto const dir = TempDir {};
    auto const path = (dir.path() / "nested" / "config.json").string();

    auto config = AppConfig {};
    config.llm.modelPath = "/models/coder.gguf";
    config.agent.maxIterations = 4;
    config.workspaceRoot = "/srv/project";
    config.terminal.blockedCommands = { "rm -rf" };
    config.mcpServers["fs"] = McpServerConfig {
        .name = "fs",
        .command = "mcp-fs",
        .args = { "--root", "/srv" },
        .env = { { "MODE", "ro" } },
        .enabled = false,
    };
    config.log.level = "trace";

    REQUIRE(saveConfigToFile(path, config));

    auto const loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->llm.modelPath == "/models/coder.gguf");
    CHECK(loaded->agent.maxIterations == 4);
    CHECK(loaded->agent.systemPrompt == config.agent.systemPrompt);
    CHECK(loaded->workspaceRoot == "/srv/project");
    CHECK(loaded->terminal.blockedCommands == std::vector<std::string> { "rm -rf" });
    REQUIRE(loaded->mcpServers.contains("fs"));
    CHECK(loaded->mcpServers.at("fs").args == std::vector<std::string> { "--root", "/srv" });
    CHECK(loaded->mcpServers.at("fs").env.at("MODE") == "ro");
    CHECK(!loaded->mcpServers.at("fs").enabled);
    CHECK(loaded->log.level == "trace");
}

TEST_CASE("loadConfigFromFile reports the path on failure", "[config]")
{
    SECTION("missing file")
    {
        auto const result = loadConfigFromFile("/nonexistent/path/config.json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("invalid content")
    {
        auto const dir = TempDir {};
        auto const path = (dir.path() / "config.json").string();
        {
            auto file = std::ofstream(path);
            file << R"({ "agent": { "maxIterations": -3 } })";
        }

        auto const result = loadConfigFromFile(path);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.starts_with(path));
    }
}
