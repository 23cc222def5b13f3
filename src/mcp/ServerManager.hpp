// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/StdioTransport.hpp>
#include <tools/ToolDefinition.hpp>
#include <tools/ToolRegistry.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief Configuration for a single MCP server.
struct McpServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
};

/// @brief Tool handler forwarding invocations to a remote MCP server.
///
/// Holds a shared reference to the server's client; the connection itself is closed
/// by ServerManager when the server is removed.
class RemoteToolHandler: public ToolHandler
{
  public:
    RemoteToolHandler(std::shared_ptr<McpClient> client, std::string toolName);

    [[nodiscard]] auto invoke(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolOutput> override;

  private:
    std::shared_ptr<McpClient> _client;
    std::string _toolName;
};

/// @brief Connects MCP servers and keeps their tools registered in the ToolRegistry.
///
/// A server's tools are registered all at once after a successful handshake and removed
/// all at once when it disconnects, so the registry never exposes a partial tool set.
class ServerManager
{
  public:
    explicit ServerManager(ToolRegistry& registry, McpClientConfig clientConfig = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Spawns a server process and connects to it over stdio.
    /// @param config The server configuration.
    /// @return Success or an error.
    [[nodiscard]] auto addServer(const McpServerConfig& config) -> VoidResult;

    /// @brief Connects a server over an already established transport.
    ///
    /// Performs the handshake, lists the server's tools, and registers them under `name`.
    /// @return Success, DuplicateName if the server or one of its tools is already known, or
    ///         the handshake error.
    [[nodiscard]] auto connect(std::string name, std::unique_ptr<Transport> transport) -> VoidResult;

    /// @brief Disconnects a server and removes its tools.
    ///
    /// Pending requests to the server fail with ToolUnavailable; the registry removal then
    /// waits for those invocations to finish.
    /// @return Success or NotFound.
    [[nodiscard]] auto removeServer(std::string_view name) -> VoidResult;

    /// @brief Returns the names of all connected servers.
    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;

    /// @brief Returns the number of connected servers.
    [[nodiscard]] auto serverCount() const -> size_t;

    /// @brief Disconnects all servers.
    void shutdown();

  private:
    ToolRegistry& _registry;
    McpClientConfig _clientConfig;
    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<McpClient>, std::less<>> _servers;
    std::set<std::string, std::less<>> _connecting; // names reserved while their handshake runs

    auto connectAndRegister(const std::string& name, std::unique_ptr<Transport> transport)
        -> Result<std::shared_ptr<McpClient>>;
};

} // namespace agentshell
