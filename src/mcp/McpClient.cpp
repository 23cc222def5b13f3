// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace agentshell
{

McpClient::McpClient(std::unique_ptr<Transport> transport, McpClientConfig config):
    _transport(std::move(transport)), _config(config)
{
}

McpClient::~McpClient()
{
    disconnect();
}

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", "2024-11-05" },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "agentshell" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            _capabilities.serverName =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "name", "unknown");
            _capabilities.serverVersion =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "version", "unknown");

            if (result.contains("capabilities"))
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            auto lock = std::lock_guard(_requestMutex);
            if (auto sent = _transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
                return std::unexpected(sent.error());

            _initialized = true;
            log::info("MCP server initialized: {} v{}", _capabilities.serverName, _capabilities.serverVersion);
            return _capabilities;
        });
}

auto McpClient::listTools() -> Result<std::vector<McpToolInfo>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    return sendRequest("tools/list").and_then([](const nlohmann::json& result) -> Result<std::vector<McpToolInfo>> {
        auto tools = std::vector<McpToolInfo> {};

        if (!result.contains("tools") || !result["tools"].is_array())
            return tools;

        for (const auto& toolJson: result["tools"])
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
            {
                log::warning("Skipping unnamed tool in tools/list response");
                continue;
            }
            tools.push_back(McpToolInfo {
                .name = std::move(name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
            });
        }

        return tools;
    });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
    -> Result<McpCallResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = sendRequest("tools/call", std::move(params), std::move(stopToken));
    if (!response)
    {
        auto error = response.error();
        if (error.code == ErrorCode::TransportError)
            error.code = ErrorCode::ToolUnavailable;
        return std::unexpected(std::move(error));
    }

    auto callResult = McpCallResult {};
    callResult.isError = json::getBoolOr(*response, "isError", false);

    if (response->contains("content") && (*response)["content"].is_array())
    {
        for (const auto& item: (*response)["content"])
        {
            if (json::getStringOr(item, "type", "") != "text")
                continue;
            if (!callResult.text.empty())
                callResult.text += "\n";
            callResult.text += json::getStringOr(item, "text", "");
        }
    }

    log::debug("Tool '{}' returned {} bytes (isError: {})", name, callResult.text.size(), callResult.isError);
    return callResult;
}

void McpClient::disconnect()
{
    if (_disconnecting.exchange(true))
        return;

    // A request in flight notices the flag within one poll interval and releases the lock.
    auto lock = std::lock_guard(_requestMutex);
    _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::stop_token stopToken)
    -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_requestMutex);
    if (_disconnecting)
        return makeError(ErrorCode::ToolUnavailable, "Tool server is disconnecting");

    auto const id = _nextId++;
    return _transport->send(jsonrpc::makeRequest(id, method, std::move(params)))
        .and_then([&]() { return awaitResponse(id, stopToken); })
        .and_then([&](const nlohmann::json& msg) -> Result<nlohmann::json> {
            return jsonrpc::parseResponse(msg).and_then([&](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                if (resp.error)
                    return makeError(ErrorCode::ProtocolError,
                                     std::format("{}: RPC error {}: {}", method, resp.error->code, resp.error->message));
                return resp.result.value_or(nlohmann::json::object());
            });
        });
}

auto McpClient::awaitResponse(int64_t id, std::stop_token stopToken) -> Result<nlohmann::json>
{
    auto const deadline = std::chrono::steady_clock::now() + _config.requestTimeout;

    while (true)
    {
        if (stopToken.stop_requested())
        {
            auto notification = jsonrpc::makeNotification(
                "notifications/cancelled", nlohmann::json { { "requestId", id }, { "reason", "Cancelled by user" } });
            if (auto sent = _transport->send(notification); !sent)
                log::debug("Could not deliver cancellation of request {}: {}", id, sent.error());
            return makeError(ErrorCode::Cancelled, std::format("Request {} cancelled", id));
        }
        if (_disconnecting)
            return makeError(ErrorCode::ToolUnavailable, "Tool server was disconnected");

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return makeError(ErrorCode::TimedOut,
                             std::format("No response to request {} within {}ms", id, _config.requestTimeout.count()));

        auto const wait =
            std::min(_config.pollInterval, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        auto message = _transport->receive(wait);
        if (!message)
        {
            if (message.error().code == ErrorCode::TimedOut)
                continue;
            return std::unexpected(message.error());
        }

        auto parsed = jsonrpc::parseResponse(*message);
        if (!parsed)
        {
            log::warning("Ignoring malformed message from tool server: {}", parsed.error());
            continue;
        }

        if (parsed->answers(id))
            return std::move(*message);

        switch (parsed->kind)
        {
            case jsonrpc::MessageKind::Request:
                // We do not offer sampling or roots; tell the server instead of leaving it waiting.
                if (auto sent = _transport->send(jsonrpc::makeErrorResponse(
                        parsed->id, jsonrpc::MethodNotFound, std::format("Method not supported: {}", parsed->method)));
                    !sent)
                    return std::unexpected(sent.error());
                break;
            case jsonrpc::MessageKind::Notification:
                log::trace("Server notification: {}", parsed->method);
                break;
            case jsonrpc::MessageKind::Response:
                log::debug("Dropping stale response (id {})", parsed->id.dump());
                break;
        }
    }
}

} // namespace agentshell
