// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerManager.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell
{

/// @brief LLM configuration section.
struct LlmConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1;
    int threads = 0;
    float temperature = 0.7f;
    float topP = 0.9f;
    int topK = 40;
    int seed = -1;
    int maxTokens = 0;
};

/// @brief Agent loop configuration section.
struct AgentSection
{
    int maxIterations = 10;
    int modelRetries = 1;
    std::string systemPrompt = defaultSystemPrompt();

    /// @brief The built-in prompt; `{workspace}` is replaced with the workspace root.
    [[nodiscard]] static auto defaultSystemPrompt() -> std::string;
};

/// @brief Terminal tool section.
struct TerminalSection
{
    int timeoutMs = 30000;
    std::size_t maxOutputBytes = 64 * 1024;
    std::vector<std::string> blockedCommands = defaultBlockedCommands();

    [[nodiscard]] static auto defaultBlockedCommands() -> std::vector<std::string>;
};

/// @brief File tools section.
struct FilesSection
{
    std::size_t maxReadBytes = 256 * 1024;
};

/// @brief Console front end section.
struct UiSection
{
    std::size_t paneBufferSize = 256;
};

/// @brief Logging section.
struct LogSection
{
    std::string level = "info";
    std::string file;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    AgentSection agent;
    std::string workspaceRoot; // empty means the current directory
    TerminalSection terminal;
    FilesSection files;
    std::map<std::string, McpServerConfig> mcpServers;
    UiSection ui;
    LogSection log;
};

/// @brief Substitutes the workspace root into a system prompt template.
[[nodiscard]] auto expandSystemPrompt(std::string_view prompt, std::string_view workspaceRoot) -> std::string;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses the application configuration from JSON text.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path ($XDG_CONFIG_HOME/agentshell or ~/.config/agentshell).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace agentshell
