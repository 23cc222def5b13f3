// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentshell/Config.hpp>
#include <core/Error.hpp>

#include <istream>
#include <memory>
#include <ostream>

namespace agentshell
{

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Initializes all components (workspace, tools, MCP servers, model).
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive shell until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& in, std::ostream& out) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentshell
