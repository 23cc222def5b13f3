// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace agentshell
{

namespace
{
    constexpr auto WorkspacePlaceholder = std::string_view { "{workspace}" };
}

auto AgentSection::defaultSystemPrompt() -> std::string
{
    return "You are a coding agent working inside the workspace at {workspace}.\n"
           "Use the available tools to inspect and modify files and to run commands. "
           "All paths are relative to the workspace root. Prefer small, verifiable steps, "
           "read a file before changing it, and summarize what you did when you are finished.";
}

auto TerminalSection::defaultBlockedCommands() -> std::vector<std::string>
{
    return {
        "sudo", "su ", "chroot", "mount", "umount", "dd ", "fdisk", "mkfs", "rm -rf", "shutdown", "reboot", "halt",
        "poweroff",
    };
}

auto expandSystemPrompt(std::string_view prompt, std::string_view workspaceRoot) -> std::string
{
    auto result = std::string(prompt);
    for (auto pos = result.find(WorkspacePlaceholder); pos != std::string::npos;
         pos = result.find(WorkspacePlaceholder, pos + workspaceRoot.size()))
        result.replace(pos, WorkspacePlaceholder.size(), workspaceRoot);
    return result;
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/agentshell";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/agentshell";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // LLM section
    if (root.contains("llm"))
    {
        auto const& llm = root["llm"];
        config.llm.modelPath = json::getStringOr(llm, "modelPath", "");
        config.llm.contextSize = json::getIntOr(llm, "contextSize", config.llm.contextSize);
        config.llm.gpuLayers = json::getIntOr(llm, "gpuLayers", config.llm.gpuLayers);
        config.llm.threads = json::getIntOr(llm, "threads", config.llm.threads);
        config.llm.temperature = json::getFloatOr(llm, "temperature", config.llm.temperature);
        config.llm.topP = json::getFloatOr(llm, "topP", config.llm.topP);
        config.llm.topK = json::getIntOr(llm, "topK", config.llm.topK);
        config.llm.seed = json::getIntOr(llm, "seed", config.llm.seed);
        config.llm.maxTokens = json::getIntOr(llm, "maxTokens", config.llm.maxTokens);
    }

    // Agent section
    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.maxIterations = json::getIntOr(agent, "maxIterations", config.agent.maxIterations);
        config.agent.modelRetries = json::getIntOr(agent, "modelRetries", config.agent.modelRetries);
        config.agent.systemPrompt = json::getStringOr(agent, "systemPrompt", config.agent.systemPrompt);

        if (config.agent.maxIterations < 0)
            return makeError(ErrorCode::ConfigError, "agent.maxIterations must not be negative");
        if (config.agent.modelRetries > 1)
            log::warning("agent.modelRetries is capped at 1 (configured: {})", config.agent.modelRetries);
        config.agent.modelRetries = std::clamp(config.agent.modelRetries, 0, 1);
    }

    // Workspace section
    if (root.contains("workspace"))
        config.workspaceRoot = json::getStringOr(root["workspace"], "root", "");

    // Tools section
    if (root.contains("tools") && root["tools"].is_object())
    {
        auto const& tools = root["tools"];
        if (tools.contains("terminal"))
        {
            auto const& terminal = tools["terminal"];
            config.terminal.timeoutMs = json::getIntOr(terminal, "timeoutMs", config.terminal.timeoutMs);
            config.terminal.maxOutputBytes = static_cast<std::size_t>(
                json::getIntOr(terminal, "maxOutputBytes", static_cast<int>(config.terminal.maxOutputBytes)));
            if (terminal.is_object() && terminal.contains("blockedCommands"))
                config.terminal.blockedCommands = json::getStringArray(terminal, "blockedCommands");

            if (config.terminal.timeoutMs <= 0)
                return makeError(ErrorCode::ConfigError, "tools.terminal.timeoutMs must be positive");
        }
        if (tools.contains("files"))
        {
            config.files.maxReadBytes = static_cast<std::size_t>(
                json::getIntOr(tools["files"], "maxReadBytes", static_cast<int>(config.files.maxReadBytes)));
        }
    }

    // MCP servers section
    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto command = json::getString(serverJson, "command");
            if (!command)
                return makeError(ErrorCode::ConfigError, std::format("mcpServers.{}: {}", name, command.error().message));

            config.mcpServers[name] = McpServerConfig {
                .name = name,
                .command = std::move(*command),
                .args = json::getStringArray(serverJson, "args"),
                .env = json::getStringMap(serverJson, "env"),
                .enabled = json::getBoolOr(serverJson, "enabled", true),
            };
        }
    }

    // UI section
    if (root.contains("ui"))
    {
        config.ui.paneBufferSize = static_cast<std::size_t>(
            std::max(1, json::getIntOr(root["ui"], "paneBufferSize", static_cast<int>(config.ui.paneBufferSize))));
    }

    // Log section
    if (root.contains("log"))
    {
        auto const& logJson = root["log"];
        config.log.level = json::getStringOr(logJson, "level", config.log.level);
        config.log.file = json::getStringOr(logJson, "file", "");
        if (!log::levelFromString(config.log.level))
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.log.level));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // LLM section
    auto llm = nlohmann::json::object();
    if (!config.llm.modelPath.empty())
        llm["modelPath"] = config.llm.modelPath;
    llm["contextSize"] = config.llm.contextSize;
    llm["gpuLayers"] = config.llm.gpuLayers;
    llm["threads"] = config.llm.threads;
    llm["temperature"] = config.llm.temperature;
    llm["topP"] = config.llm.topP;
    llm["topK"] = config.llm.topK;
    llm["seed"] = config.llm.seed;
    llm["maxTokens"] = config.llm.maxTokens;
    root["llm"] = std::move(llm);

    root["agent"] = nlohmann::json {
        { "maxIterations", config.agent.maxIterations },
        { "modelRetries", config.agent.modelRetries },
        { "systemPrompt", config.agent.systemPrompt },
    };

    if (!config.workspaceRoot.empty())
        root["workspace"] = nlohmann::json { { "root", config.workspaceRoot } };

    root["tools"] = nlohmann::json {
        { "terminal",
          {
              { "timeoutMs", config.terminal.timeoutMs },
              { "maxOutputBytes", config.terminal.maxOutputBytes },
              { "blockedCommands", config.terminal.blockedCommands },
          } },
        { "files", { { "maxReadBytes", config.files.maxReadBytes } } },
    };

    // MCP servers section
    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& [name, serverConfig]: config.mcpServers)
        {
            auto server = nlohmann::json::object();
            server["command"] = serverConfig.command;
            if (!serverConfig.args.empty())
                server["args"] = serverConfig.args;
            if (!serverConfig.env.empty())
                server["env"] = serverConfig.env;
            if (!serverConfig.enabled)
                server["enabled"] = false;
            servers[name] = std::move(server);
        }
        root["mcpServers"] = std::move(servers);
    }

    root["ui"] = nlohmann::json { { "paneBufferSize", config.ui.paneBufferSize } };

    auto logJson = nlohmann::json { { "level", config.log.level } };
    if (!config.log.file.empty())
        logJson["file"] = config.log.file;
    root["log"] = std::move(logJson);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::ConfigError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace agentshell
