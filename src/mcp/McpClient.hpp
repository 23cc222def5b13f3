// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
};

/// @brief A tool as advertised by `tools/list`.
struct McpToolInfo
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief The outcome of `tools/call`: concatenated text content and the server's error flag.
struct McpCallResult
{
    std::string text;
    bool isError = false;
};

/// @brief Timing settings of an McpClient.
struct McpClientConfig
{
    std::chrono::milliseconds requestTimeout { 60000 };
    std::chrono::milliseconds pollInterval { 100 };
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle: initialize, list tools, call tools. Requests are serialized
/// per client; each waits for the response with the matching id and skips interleaved
/// notifications and stale responses of abandoned requests.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    /// @param config Timeouts.
    explicit McpClient(std::unique_ptr<Transport> transport, McpClientConfig config = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize() -> Result<McpServerCapabilities>;

    /// @brief Lists available tools from the server.
    /// @return The advertised tools or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<McpToolInfo>>;

    /// @brief Calls a tool on the server.
    ///
    /// If stop is requested while waiting, a `notifications/cancelled` is sent and Cancelled
    /// returned. A lost connection or a disconnect() in progress yields ToolUnavailable.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @param stopToken Cancellation of the calling invocation.
    /// @return The tool result or an error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<McpCallResult>;

    /// @brief Makes all pending and future requests fail with ToolUnavailable, then closes the transport.
    void disconnect();

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpClientConfig _config;
    McpServerCapabilities _capabilities;
    std::mutex _requestMutex;
    int64_t _nextId = 1;
    bool _initialized = false;
    std::atomic<bool> _disconnecting = false;

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params = nullptr,
                                   std::stop_token stopToken = {}) -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitResponse(int64_t id, std::stop_token stopToken) -> Result<nlohmann::json>;
};

} // namespace agentshell
