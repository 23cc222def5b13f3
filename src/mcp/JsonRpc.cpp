// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace agentshell::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");
        response.method = message["method"].get<std::string>();
        response.kind = message.contains("id") ? MessageKind::Request : MessageKind::Notification;
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

} // namespace agentshell::jsonrpc
