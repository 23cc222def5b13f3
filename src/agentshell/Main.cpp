// SPDX-License-Identifier: Apache-2.0
#include <agentshell/App.hpp>
#include <agentshell/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "agentshell: a local coding assistant with tool and MCP integration" };

    auto modelPath = std::string {};
    auto configPath = std::string {};
    auto workspace = std::string {};
    auto maxIterations = -1;
    auto contextSize = 0;
    auto gpuLayers = -1;
    auto temperature = 0.0f;
    auto verbose = false;

    app.add_option("-m,--model", modelPath, "Path to GGUF model file");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-w,--workspace", workspace, "Workspace root the tools are confined to")->check(CLI::ExistingDirectory);
    app.add_option("--max-iterations", maxIterations, "Maximum tool cycles per request");
    app.add_option("--context-size", contextSize, "Context window size");
    app.add_option("--gpu-layers", gpuLayers, "Number of GPU layers (-1 = auto)");
    app.add_option("--temperature", temperature, "Sampling temperature");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? agentshell::loadConfig() : agentshell::loadConfigFromFile(configPath);
    if (!configResult)
    {
        agentshell::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.llm.modelPath = modelPath;
    if (!workspace.empty())
        config.workspaceRoot = workspace;
    if (maxIterations >= 0)
        config.agent.maxIterations = maxIterations;
    if (contextSize > 0)
        config.llm.contextSize = contextSize;
    if (gpuLayers != -1)
        config.llm.gpuLayers = gpuLayers;
    if (temperature > 0.0f)
        config.llm.temperature = temperature;
    if (verbose)
        config.log.level = "debug";

    auto application = agentshell::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        agentshell::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run(std::cin, std::cout);
}
