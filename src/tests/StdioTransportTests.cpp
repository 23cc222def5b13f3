// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace agentshell;

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive(std::chrono::milliseconds(10));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport can spawn and communicate with a simple process", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "cat",
        .args = {},
        .env = {},
    };

    auto startResult = transport.start(config);
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());

    auto msg = nlohmann::json { { "test", "hello" } };
    auto sendResult = transport.send(msg);
    REQUIRE(sendResult.has_value());

    // cat echoes stdin back
    auto recvResult = transport.receive(std::chrono::seconds(5));
    REQUIRE(recvResult.has_value());
    CHECK((*recvResult)["test"] == "hello");

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "/nonexistent/command/that/does/not/exist",
        .args = {},
        .env = {},
    };

    auto result = transport.start(config);
    // posix_spawnp may report success and let the child fail instead.
    if (result.has_value())
    {
        auto recvResult = transport.receive(std::chrono::seconds(5));
        CHECK(!recvResult.has_value());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::TransportError);
    }
}

TEST_CASE("StdioTransport receive times out while the server is silent", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "sleep", .args = { "5" }, .env = {} }));

    auto const started = std::chrono::steady_clock::now();
    auto const result = transport.receive(std::chrono::milliseconds(100));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimedOut);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    CHECK(transport.isConnected());
}

TEST_CASE("StdioTransport reports a server that exited", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "true", .args = {}, .env = {} }));

    auto const result = transport.receive(std::chrono::seconds(5));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport passes environment overrides to the server", "[transport]")
{
    auto transport = StdioTransport();
    auto const config = StdioTransportConfig {
        .command = "sh",
        .args = { "-c", "printf '{\"value\":\"%s\"}\\n' \"$AGENTSHELL_TRANSPORT\"" },
        .env = { { "AGENTSHELL_TRANSPORT", "over-pipe" } },
    };
    REQUIRE(transport.start(config));

    auto const message = transport.receive(std::chrono::seconds(5));
    REQUIRE(message.has_value());
    CHECK((*message)["value"] == "over-pipe");
}
