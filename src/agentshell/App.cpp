// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/AgentLoop.hpp>
#include <agentshell/Console.hpp>
#include <agentshell/Panes.hpp>
#include <conversation/ConversationState.hpp>
#include <core/Log.hpp>
#include <llm/LlamaModelClient.hpp>
#include <mcp/ServerManager.hpp>
#include <session/SessionController.hpp>
#include <stream/StreamBroker.hpp>
#include <tools/LocalTools.hpp>
#include <tools/ToolRegistry.hpp>
#include <tools/Workspace.hpp>

#include <filesystem>
#include <format>
#include <string>
#include <vector>

namespace agentshell
{

namespace
{
    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  /help          Show this help\n"
        "  /tools         List the registered tools\n"
        "  /servers       List the connected MCP servers\n"
        "  /cancel        Cancel the running request\n"
        "  /clear         Cancel and start a fresh conversation\n"
        "  /quit, /exit   Leave the shell\n"
        "Anything else is sent to the assistant.\n"
    };

    auto levelTag(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "[error] ";
            case log::Level::Warning: return "[warn] ";
            default: return "[log] ";
        }
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    StreamBroker broker;
    ToolRegistry registry;
    ServerManager servers { registry };
    LlamaModelClient model;
    std::shared_ptr<const Workspace> workspace;
    std::unique_ptr<ConversationState> state;
    std::unique_ptr<AgentLoop> loop;
    std::unique_ptr<SessionController> session;

    explicit Impl(AppConfig cfg): config(std::move(cfg)), broker(config.ui.paneBufferSize) {}

    auto openWorkspace() -> VoidResult
    {
        auto root = std::filesystem::path(config.workspaceRoot);
        if (root.empty())
            root = std::filesystem::current_path();

        auto opened = Workspace::open(root);
        if (!opened)
            return std::unexpected(opened.error());

        workspace = std::make_shared<const Workspace>(std::move(*opened));
        log::info("Workspace: {}", workspace->root().string());
        return {};
    }

    void connectServers()
    {
        for (const auto& [name, serverConfig]: config.mcpServers)
        {
            if (!serverConfig.enabled)
            {
                log::debug("MCP server '{}' is disabled", name);
                continue;
            }

            auto namedConfig = serverConfig;
            namedConfig.name = name;
            auto added = servers.addServer(namedConfig);
            if (!added)
                log::warning("Failed to connect MCP server '{}': {}", name, added.error().message);
        }
    }

    auto loadModel() -> VoidResult
    {
        if (config.llm.modelPath.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("No model configured; pass --model or set llm.modelPath in {}",
                                         defaultConfigPath()));

        return model.load(LlamaModelConfig {
            .modelPath = config.llm.modelPath,
            .contextSize = config.llm.contextSize,
            .gpuLayers = config.llm.gpuLayers,
            .threads = config.llm.threads,
            .temperature = config.llm.temperature,
            .topP = config.llm.topP,
            .topK = config.llm.topK,
            .seed = config.llm.seed,
            .maxTokens = config.llm.maxTokens,
        });
    }

    void listTools(Console& console) const
    {
        auto const tools = registry.list();
        console.println("{} tool(s):", tools.size());
        for (const auto& tool: tools)
        {
            if (tool.owner.empty())
                console.println("  {:<18} {}", tool.name, tool.description);
            else
                console.println("  {:<18} {} [{}]", tool.name, tool.description, tool.owner);
        }
    }

    void listServers(Console& console) const
    {
        auto const names = servers.serverNames();
        if (names.empty())
        {
            console.println("No MCP servers connected.");
            return;
        }
        for (const auto& name: names)
            console.println("  {}", name);
    }

    /// @brief Handles a slash command. Returns false when the shell should exit.
    auto handleCommand(std::string_view command, Console& console) -> bool
    {
        if (command == "/quit" || command == "/exit")
            return false;

        if (command == "/help")
            console.write(HelpText);
        else if (command == "/tools")
            listTools(console);
        else if (command == "/servers")
            listServers(console);
        else if (command == "/cancel")
        {
            if (!session->cancelCurrent())
                console.println("Nothing to cancel.");
        }
        else if (command == "/clear")
        {
            (void) session->cancelCurrent();
            state->clear();
            console.println("Conversation cleared.");
        }
        else
            console.println("Unknown command: {} (try /help)", command);
        return true;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    log::setCallback({});
}

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    if (auto const level = log::levelFromString(impl.config.log.level))
        log::setLevel(*level);
    if (!impl.config.log.file.empty())
    {
        if (auto opened = log::setFile(impl.config.log.file); !opened)
            return opened;
    }

    if (auto opened = impl.openWorkspace(); !opened)
        return opened;

    auto toolsConfig = LocalToolsConfig {
        .terminal = TerminalToolConfig {
            .timeout = std::chrono::milliseconds(impl.config.terminal.timeoutMs),
            .maxOutputBytes = impl.config.terminal.maxOutputBytes,
            .blockedCommands = impl.config.terminal.blockedCommands,
        },
        .files = FileToolsConfig { .maxReadBytes = impl.config.files.maxReadBytes },
    };
    if (auto registered = registerLocalTools(impl.registry, impl.workspace, toolsConfig); !registered)
        return registered;

    impl.connectServers();

    if (auto loaded = impl.loadModel(); !loaded)
        return loaded;

    impl.state = std::make_unique<ConversationState>(
        expandSystemPrompt(impl.config.agent.systemPrompt, impl.workspace->root().string()));

    impl.loop = std::make_unique<AgentLoop>(*impl.state,
                                            impl.registry,
                                            impl.model,
                                            impl.broker,
                                            AgentConfig {
                                                .maxIterations = impl.config.agent.maxIterations,
                                                .modelRetries = impl.config.agent.modelRetries,
                                            });
    impl.session = std::make_unique<SessionController>(*impl.state, *impl.loop);

    log::info("Application initialized with {} tool(s)", impl.registry.size());
    return {};
}

auto App::run(std::istream& in, std::ostream& out) -> int
{
    auto& impl = *_impl;
    if (!impl.session)
    {
        log::error("App::run() called before a successful initialize()");
        return 1;
    }

    auto console = Console(out);
    log::setCallback([&console](log::Level level, std::string_view message) {
        console.writeLines(levelTag(level), message);
    });

    auto const paneCapacity = impl.config.ui.paneBufferSize;
    auto panes = std::vector<std::unique_ptr<Pane>> {};
    panes.push_back(std::make_unique<ChatPane>(console));
    panes.push_back(std::make_unique<EditorPane>(console));
    panes.push_back(std::make_unique<TerminalPane>(console));
    for (auto& pane: panes)
        pane->start(impl.broker, paneCapacity);

    console.println("agentshell: {} (type /help for commands)", impl.workspace->root().string());

    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (line.empty())
            continue;

        if (line.starts_with('/'))
        {
            if (!impl.handleCommand(line, console))
                break;
            continue;
        }

        auto const runId = impl.session->submit(line);
        log::debug("Submitted run {}", runId);
    }

    // End of input still lets the last request finish; /quit cancels it.
    if (in.eof())
        (void) impl.session->wait();
    else
        (void) impl.session->cancelCurrent();

    for (auto& pane: panes)
        pane->stop();
    log::setCallback({});

    impl.servers.shutdown();
    return 0;
}

} // namespace agentshell
