// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace agentshell::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error code for unknown methods.
constexpr auto MethodNotFound = -32601;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Classification of an incoming JSON-RPC message.
enum class MessageKind
{
    Response,
    Request,
    Notification,
};

/// @brief Represents a parsed incoming JSON-RPC 2.0 message.
///
/// Servers send responses to our requests, but may also interleave notifications
/// (e.g. progress or log messages) and requests of their own.
struct Response
{
    MessageKind kind = MessageKind::Response;
    nlohmann::json id;
    std::string method;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if this is the response to the request with the given id.
    [[nodiscard]] auto answers(int64_t requestId) const -> bool
    {
        return kind == MessageKind::Response && id.is_number_integer() && id.get<int64_t>() == requestId;
    }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response, e.g. to reject a server-initiated request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses and classifies an incoming JSON-RPC 2.0 message.
/// @param message The JSON message to parse.
/// @return The parsed message or a ProtocolError.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace agentshell::jsonrpc
