// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace agentshell
{

/// @brief Represents a tool call request from the model.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief Outcome class of a tool invocation.
enum class ToolStatus
{
    Ok,
    Error,
};

[[nodiscard]] constexpr auto toolStatusToString(ToolStatus status) -> std::string_view
{
    switch (status)
    {
        case ToolStatus::Ok: return "ok";
        case ToolStatus::Error: return "error";
    }
    return "unknown";
}

/// @brief Uniform result envelope of a tool invocation.
///
/// On success `payload` holds the tool output. On failure `errorCode` classifies the
/// failure and `errorDetail` describes it; `payload` may still carry partial output
/// (e.g. the captured stdout of a failed command).
struct ToolResult
{
    std::string callId;
    ToolStatus status = ToolStatus::Ok;
    std::string payload;
    ErrorCode errorCode = ErrorCode::Unknown;
    std::string errorDetail;
    std::chrono::milliseconds duration { 0 };

    [[nodiscard]] auto isError() const -> bool { return status == ToolStatus::Error; }

    /// @brief Builds a successful result.
    [[nodiscard]] static auto success(std::string callId, std::string payload) -> ToolResult
    {
        auto result = ToolResult {};
        result.callId = std::move(callId);
        result.payload = std::move(payload);
        return result;
    }

    /// @brief Builds a failed result from an Error.
    [[nodiscard]] static auto failure(std::string callId, const Error& error) -> ToolResult
    {
        auto result = ToolResult {};
        result.callId = std::move(callId);
        result.status = ToolStatus::Error;
        result.errorCode = error.code;
        result.errorDetail = error.message;
        return result;
    }

    /// @brief Renders the result as the text the model sees.
    [[nodiscard]] auto toModelText() const -> std::string
    {
        if (!isError())
            return payload;

        auto text = std::format("Error [{}]: {}", errorCodeName(errorCode), errorDetail);
        if (!payload.empty())
            text += "\n" + payload;
        return text;
    }
};

/// @brief Schema for an input parameter in a tool definition.
///
/// `type` is one of the JSON schema primitive names: "string", "integer", "number",
/// "boolean", "array", "object", or "any" for unconstrained values.
struct ToolParameter
{
    std::string name;
    std::string type;
    std::string description;
    bool required = false;
};

} // namespace agentshell
