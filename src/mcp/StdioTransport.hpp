// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace agentshell
{

/// @brief Configuration for spawning a remote tool server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Transport that talks newline-delimited JSON to a child process over stdio pipes.
///
/// The child's stderr is discarded so server diagnostics do not interleave with the console.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the server process.
    /// @param config The process configuration.
    /// @return Success or a TransportError.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentshell
