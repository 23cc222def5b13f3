// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/ToolDefinition.hpp>

#include <nlohmann/json.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace agentshell::schema
{

/// @brief Checks tool arguments against a tool's declared parameters.
///
/// Arguments must be a JSON object (null counts as empty). Every required parameter must be
/// present and non-null, every present parameter must match its declared type, and unknown
/// arguments are rejected unless the definition allows them.
/// @return Success or a ValidationError naming the offending argument.
[[nodiscard]] auto validateArguments(const ToolDefinition& definition, const nlohmann::json& arguments)
    -> VoidResult;

/// @brief Returns true if the JSON value matches the schema type name.
[[nodiscard]] auto matchesType(std::string_view type, const nlohmann::json& value) -> bool;

/// @brief Converts a JSON schema object ("properties" / "required") into typed parameters.
[[nodiscard]] auto parametersFromJsonSchema(const nlohmann::json& inputSchema) -> std::vector<ToolParameter>;

/// @brief Renders parameters as a JSON schema object, used to advertise tools to the model.
[[nodiscard]] auto toJsonSchema(std::span<const ToolParameter> parameters) -> nlohmann::json;

/// @brief Renders a tool definition as a catalog entry: name, description and JSON schema.
[[nodiscard]] auto toCatalogEntry(const ToolDefinition& definition) -> nlohmann::json;

} // namespace agentshell::schema
