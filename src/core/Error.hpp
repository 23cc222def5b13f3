// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace agentshell
{

/// @brief Error codes for categorizing failures across the application.
///
/// The first group is visible to the model and the user as part of tool results
/// or run outcomes; the second group is internal plumbing.
enum class ErrorCode
{
    Unknown,

    // Tool- and run-level taxonomy
    ValidationError,
    ToolExecutionError,
    ToolUnavailable,
    ModelError,
    IterationLimitExceeded,
    AccessDenied,
    DuplicateName,
    NotFound,
    Cancelled,
    TimedOut,

    // Plumbing
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    TransportError,
    ProtocolError,
};

/// @brief Returns the stable display name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::ToolExecutionError: return "ToolExecutionError";
        case ErrorCode::ToolUnavailable: return "ToolUnavailable";
        case ErrorCode::ModelError: return "ModelError";
        case ErrorCode::IterationLimitExceeded: return "IterationLimitExceeded";
        case ErrorCode::AccessDenied: return "AccessDenied";
        case ErrorCode::DuplicateName: return "DuplicateName";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TimedOut: return "TimedOut";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns true if the error is worth one automatic retry of a model call.
[[nodiscard]] constexpr auto isTransient(const Error& error) -> bool
{
    switch (error.code)
    {
        case ErrorCode::ModelError:
        case ErrorCode::TransportError:
        case ErrorCode::TimedOut: return true;
        default: return false;
    }
}

} // namespace agentshell

template <>
struct std::formatter<agentshell::Error>: std::formatter<std::string>
{
    auto format(const agentshell::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", agentshell::errorCodeName(error.code), error.message), ctx);
    }
};
