// SPDX-License-Identifier: Apache-2.0
#include "ToolExecutor.hpp"

#include <core/Log.hpp>
#include <tools/ToolSchema.hpp>

#include <exception>
#include <format>

namespace agentshell
{

ToolExecutor::ToolExecutor(const ToolRegistry& registry): _registry(registry)
{
}

auto ToolExecutor::execute(const ToolInvocation& invocation) const noexcept -> ToolResult
{
    auto result = ToolResult {};
    try
    {
        result = run(invocation);
    }
    catch (const std::exception& e)
    {
        log::error("Tool '{}' (id: {}) threw: {}", invocation.toolName, invocation.id, e.what());
        result = ToolResult::failure(
            invocation.id,
            Error { ErrorCode::ToolExecutionError, std::format("Tool '{}' failed: {}", invocation.toolName, e.what()) });
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                            - invocation.startedAt);
    return result;
}

auto ToolExecutor::run(const ToolInvocation& invocation) const -> ToolResult
{
    if (invocation.stopToken.stop_requested())
        return ToolResult::failure(invocation.id,
                                   Error { ErrorCode::Cancelled, "Cancelled before the tool was started" });

    auto lease = _registry.acquire(invocation.toolName);
    if (!lease)
    {
        // The model asked for something that does not exist; that is a bad argument, not a crash.
        auto error = lease.error();
        if (error.code == ErrorCode::NotFound)
            error.code = ErrorCode::ValidationError;
        return ToolResult::failure(invocation.id, error);
    }

    auto const& definition = lease->definition();

    if (auto valid = schema::validateArguments(definition, invocation.arguments); !valid)
    {
        log::warning("Rejected arguments for tool '{}': {}", definition.name, valid.error().message);
        return ToolResult::failure(invocation.id, valid.error());
    }

    log::info("Executing tool: {} (id: {})", definition.name, invocation.id);

    auto const& arguments =
        invocation.arguments.is_null() ? nlohmann::json::object() : invocation.arguments;
    auto output = definition.handler->invoke(arguments, invocation.stopToken);
    if (!output)
    {
        log::warning("Tool '{}' (id: {}) failed: {}", definition.name, invocation.id, output.error());
        return ToolResult::failure(invocation.id, output.error());
    }

    if (output->failed)
    {
        auto result = ToolResult::failure(invocation.id,
                                          Error { ErrorCode::ToolExecutionError, std::move(output->failureDetail) });
        result.payload = std::move(output->text);
        return result;
    }

    log::debug("Tool '{}' (id: {}) succeeded", definition.name, invocation.id);
    return ToolResult::success(invocation.id, std::move(output->text));
}

} // namespace agentshell
