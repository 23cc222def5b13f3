// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <tools/ToolSchema.hpp>

#include <format>

namespace agentshell
{

RemoteToolHandler::RemoteToolHandler(std::shared_ptr<McpClient> client, std::string toolName):
    _client(std::move(client)), _toolName(std::move(toolName))
{
}

auto RemoteToolHandler::invoke(const nlohmann::json& arguments, std::stop_token stopToken) -> Result<ToolOutput>
{
    auto result = _client->callTool(_toolName, arguments, std::move(stopToken));
    if (!result)
        return std::unexpected(result.error());

    if (result->isError)
        return ToolOutput { .text = result->text, .failed = true, .failureDetail = result->text };
    return ToolOutput { .text = std::move(result->text), .failed = false, .failureDetail = {} };
}

ServerManager::ServerManager(ToolRegistry& registry, McpClientConfig clientConfig):
    _registry(registry), _clientConfig(clientConfig)
{
}

ServerManager::~ServerManager()
{
    shutdown();
}

auto ServerManager::addServer(const McpServerConfig& config) -> VoidResult
{
    auto transport = std::make_unique<StdioTransport>();

    auto transportConfig = StdioTransportConfig {
        .command = config.command,
        .args = config.args,
        .env = config.env,
    };

    if (auto started = transport->start(transportConfig); !started)
        return started;

    return connect(config.name, std::move(transport));
}

auto ServerManager::connect(std::string name, std::unique_ptr<Transport> transport) -> VoidResult
{
    if (name.empty())
        return makeError(ErrorCode::InvalidArgument, "Server name must not be empty");

    {
        auto lock = std::lock_guard(_mutex);
        if (_servers.contains(name) || !_connecting.insert(name).second)
            return makeError(ErrorCode::DuplicateName, std::format("Server '{}' is already connected", name));
    }

    auto client = connectAndRegister(name, std::move(transport));

    auto lock = std::lock_guard(_mutex);
    _connecting.erase(name);
    if (!client)
        return std::unexpected(client.error());
    _servers.emplace(name, std::move(*client));
    return {};
}

auto ServerManager::connectAndRegister(const std::string& name, std::unique_ptr<Transport> transport)
    -> Result<std::shared_ptr<McpClient>>
{
    auto client = std::make_shared<McpClient>(std::move(transport), _clientConfig);

    auto initResult = client->initialize();
    if (!initResult)
        return std::unexpected(initResult.error());

    auto toolsResult = client->listTools();
    if (!toolsResult)
    {
        log::warning("Failed to list tools for server '{}': {}", name, toolsResult.error().message);
        return std::unexpected(toolsResult.error());
    }

    auto definitions = std::vector<ToolDefinition> {};
    for (auto& tool: *toolsResult)
    {
        auto const additional = tool.inputSchema.is_object()
                                    ? tool.inputSchema.value("additionalProperties", nlohmann::json(true))
                                    : nlohmann::json(true);
        definitions.push_back(ToolDefinition {
            .name = tool.name,
            .description = std::move(tool.description),
            .parameters = schema::parametersFromJsonSchema(tool.inputSchema),
            .handler = std::make_shared<RemoteToolHandler>(client, tool.name),
            .owner = name,
            .allowAdditionalArguments = !additional.is_boolean() || additional.get<bool>(),
        });
    }

    auto const toolCount = definitions.size();
    if (auto registered = _registry.registerServer(name, std::move(definitions)); !registered)
    {
        client->disconnect();
        return std::unexpected(registered.error());
    }

    log::info("MCP server '{}' connected with {} tools", name, toolCount);
    return client;
}

auto ServerManager::removeServer(std::string_view name) -> VoidResult
{
    auto client = std::shared_ptr<McpClient> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _servers.find(name);
        if (it == _servers.end())
            return makeError(ErrorCode::NotFound, std::format("Unknown server: {}", name));
        client = std::move(it->second);
        _servers.erase(it);
    }

    client->disconnect();
    auto const removed = _registry.removeServer(name);
    log::info("MCP server '{}' disconnected ({} tools removed)", name, removed);
    return {};
}

auto ServerManager::serverNames() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    for (const auto& [name, client]: _servers)
        names.push_back(name);
    return names;
}

auto ServerManager::serverCount() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _servers.size();
}

void ServerManager::shutdown()
{
    for (const auto& name: serverNames())
    {
        if (auto removed = removeServer(name); !removed)
            log::debug("Server '{}' already gone: {}", name, removed.error());
    }
}

} // namespace agentshell
