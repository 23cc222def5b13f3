// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace agentshell
{

/// @brief Abstract interface for remote tool server communication.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Waits up to `timeout` for the next JSON message from the server.
    /// @return The received message, TimedOut if nothing arrived in time, or a TransportError
    ///         once the connection is lost.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace agentshell
