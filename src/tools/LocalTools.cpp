// SPDX-License-Identifier: Apache-2.0
#include "LocalTools.hpp"

#include <core/Log.hpp>
#include <tools/SearchTools.hpp>

namespace agentshell
{

auto registerLocalTools(ToolRegistry& registry,
                        std::shared_ptr<const Workspace> workspace,
                        const LocalToolsConfig& config) -> VoidResult
{
    auto definitions = std::vector<ToolDefinition> {};
    definitions.push_back(TerminalTool::definition(workspace, config.terminal));
    for (auto& definition: fileToolDefinitions(workspace, config.files))
        definitions.push_back(std::move(definition));
    for (auto& definition: searchToolDefinitions(workspace))
        definitions.push_back(std::move(definition));

    for (auto& definition: definitions)
    {
        if (auto result = registry.registerTool(std::move(definition)); !result)
            return result;
    }

    log::info("Registered {} built-in tools (workspace: {})", definitions.size(), workspace->root().string());
    return {};
}

} // namespace agentshell
