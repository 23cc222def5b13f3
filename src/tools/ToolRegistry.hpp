// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <tools/ToolDefinition.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell
{

/// @brief A tool definition pinned for the duration of one invocation.
///
/// While a lease is alive, the tool's owning server cannot be removed from the registry;
/// removeServer() waits until all leases on that server are released.
class ToolLease
{
  public:
    [[nodiscard]] auto definition() const -> const ToolDefinition& { return _definition; }

  private:
    friend class ToolRegistry;

    ToolLease(ToolDefinition definition, std::shared_lock<std::shared_mutex> lock):
        _definition(std::move(definition)), _lock(std::move(lock))
    {
    }

    ToolDefinition _definition;
    std::shared_lock<std::shared_mutex> _lock;
};

/// @brief Holds all invocable tools, keyed by unique name, in registration order.
///
/// Read-mostly: lookups take a shared lock, registration and removal an exclusive one, so a
/// lookup sees either all or none of a server's tools. Each owner (local tools share the
/// empty owner) additionally has a drain lock held shared by every live ToolLease.
class ToolRegistry
{
  public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// @brief Registers a single tool.
    /// @return Success, DuplicateName if the name exists, or InvalidArgument for an incomplete definition.
    [[nodiscard]] auto registerTool(ToolDefinition definition) -> VoidResult;

    /// @brief Registers all tools of a remote server at once.
    ///
    /// Either every tool is registered or none is; the definitions' owner is set to `owner`.
    /// @return Success, or DuplicateName if any name collides (including within the batch).
    [[nodiscard]] auto registerServer(std::string_view owner, std::vector<ToolDefinition> definitions)
        -> VoidResult;

    /// @brief Removes all tools of a remote server at once.
    ///
    /// Blocks until every in-flight invocation of that server's tools has released its lease.
    /// @return The number of tools removed.
    auto removeServer(std::string_view owner) -> std::size_t;

    /// @brief Looks up a tool by name.
    /// @return A copy of the definition or NotFound.
    [[nodiscard]] auto lookup(std::string_view name) const -> Result<ToolDefinition>;

    /// @brief Looks up a tool and pins its owner for the duration of an invocation.
    /// @return The lease, NotFound, or ToolUnavailable if its server is being removed.
    [[nodiscard]] auto acquire(std::string_view name) const -> Result<ToolLease>;

    /// @brief Returns all tools in registration order.
    [[nodiscard]] auto list() const -> std::vector<ToolDefinition>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    struct OwnerSlot
    {
        std::shared_mutex drain;
        bool retired = false; // guarded by drain
    };

    mutable std::shared_mutex _mutex;
    std::vector<ToolDefinition> _tools;
    std::map<std::string, std::shared_ptr<OwnerSlot>, std::less<>> _owners;

    [[nodiscard]] auto findLocked(std::string_view name) const -> const ToolDefinition*;
    [[nodiscard]] auto slotLocked(std::string_view owner) -> std::shared_ptr<OwnerSlot>;
};

} // namespace agentshell
