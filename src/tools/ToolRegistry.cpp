// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace agentshell
{

ToolRegistry::ToolRegistry() = default;

ToolRegistry::~ToolRegistry() = default;

auto ToolRegistry::registerTool(ToolDefinition definition) -> VoidResult
{
    if (definition.name.empty() || !definition.handler)
        return makeError(ErrorCode::InvalidArgument, "Tool definition requires a name and a handler");

    auto lock = std::unique_lock(_mutex);
    if (findLocked(definition.name))
        return makeError(ErrorCode::DuplicateName, std::format("Tool already registered: {}", definition.name));

    (void) slotLocked(definition.owner);
    log::debug("Tool registered: {}", definition.name);
    _tools.push_back(std::move(definition));
    return {};
}

auto ToolRegistry::registerServer(std::string_view owner, std::vector<ToolDefinition> definitions) -> VoidResult
{
    if (owner.empty())
        return makeError(ErrorCode::InvalidArgument, "Remote server name must not be empty");

    auto lock = std::unique_lock(_mutex);

    if (std::ranges::any_of(_tools, [&](const ToolDefinition& tool) { return tool.owner == owner; }))
        return makeError(ErrorCode::DuplicateName, std::format("Server '{}' has already registered its tools", owner));

    auto batchNames = std::set<std::string, std::less<>> {};
    for (const auto& definition: definitions)
    {
        if (definition.name.empty() || !definition.handler)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Server '{}' provided an incomplete tool definition", owner));
        if (findLocked(definition.name) || !batchNames.insert(definition.name).second)
            return makeError(ErrorCode::DuplicateName,
                             std::format("Tool '{}' of server '{}' is already registered", definition.name, owner));
    }

    (void) slotLocked(owner);

    for (auto& definition: definitions)
    {
        definition.owner = std::string(owner);
        log::info("  Tool registered: {} (from server '{}')", definition.name, owner);
        _tools.push_back(std::move(definition));
    }
    return {};
}

auto ToolRegistry::removeServer(std::string_view owner) -> std::size_t
{
    auto slot = std::shared_ptr<OwnerSlot> {};
    {
        auto lock = std::shared_lock(_mutex);
        auto const it = _owners.find(owner);
        if (it == _owners.end() || owner.empty())
            return 0;
        slot = it->second;
    }

    // Wait for in-flight invocations to drain; new acquirers block here and then see `retired`.
    auto drainLock = std::unique_lock(slot->drain);
    slot->retired = true;

    auto lock = std::unique_lock(_mutex);
    auto const removed = std::erase_if(_tools, [&](const ToolDefinition& t) { return t.owner == owner; });
    _owners.erase(std::string(owner));
    log::info("Removed {} tool(s) of server '{}'", removed, owner);
    return removed;
}

auto ToolRegistry::lookup(std::string_view name) const -> Result<ToolDefinition>
{
    auto lock = std::shared_lock(_mutex);
    auto const* definition = findLocked(name);
    if (!definition)
        return makeError(ErrorCode::NotFound, std::format("Unknown tool: {}", name));
    return *definition;
}

auto ToolRegistry::acquire(std::string_view name) const -> Result<ToolLease>
{
    auto definition = ToolDefinition {};
    auto slot = std::shared_ptr<OwnerSlot> {};
    {
        auto lock = std::shared_lock(_mutex);
        auto const* found = findLocked(name);
        if (!found)
            return makeError(ErrorCode::NotFound, std::format("Unknown tool: {}", name));
        definition = *found;
        slot = _owners.find(definition.owner)->second;
    }

    auto drainLock = std::shared_lock(slot->drain);
    if (slot->retired)
        return makeError(ErrorCode::ToolUnavailable,
                         std::format("Server '{}' providing tool '{}' was disconnected", definition.owner, name));

    return ToolLease(std::move(definition), std::move(drainLock));
}

auto ToolRegistry::list() const -> std::vector<ToolDefinition>
{
    auto lock = std::shared_lock(_mutex);
    return _tools;
}

auto ToolRegistry::contains(std::string_view name) const -> bool
{
    auto lock = std::shared_lock(_mutex);
    return findLocked(name) != nullptr;
}

auto ToolRegistry::size() const -> std::size_t
{
    auto lock = std::shared_lock(_mutex);
    return _tools.size();
}

auto ToolRegistry::findLocked(std::string_view name) const -> const ToolDefinition*
{
    auto const it = std::ranges::find(_tools, name, &ToolDefinition::name);
    return it == _tools.end() ? nullptr : &*it;
}

auto ToolRegistry::slotLocked(std::string_view owner) -> std::shared_ptr<OwnerSlot>
{
    auto it = _owners.find(owner);
    if (it == _owners.end())
        it = _owners.emplace(std::string(owner), std::make_shared<OwnerSlot>()).first;
    return it->second;
}

} // namespace agentshell
