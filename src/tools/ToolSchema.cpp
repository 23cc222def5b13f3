// SPDX-License-Identifier: Apache-2.0
#include "ToolSchema.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <string>

namespace agentshell::schema
{

auto matchesType(std::string_view type, const nlohmann::json& value) -> bool
{
    if (type == "string")
        return value.is_string();
    if (type == "integer")
        return value.is_number_integer();
    if (type == "number")
        return value.is_number();
    if (type == "boolean")
        return value.is_boolean();
    if (type == "array")
        return value.is_array();
    if (type == "object")
        return value.is_object();
    return true; // "any" and unknown type names are unconstrained
}

auto validateArguments(const ToolDefinition& definition, const nlohmann::json& arguments) -> VoidResult
{
    if (!arguments.is_null() && !arguments.is_object())
        return makeError(ErrorCode::ValidationError,
                         std::format("Arguments for '{}' must be a JSON object", definition.name));

    auto const empty = nlohmann::json::object();
    auto const& args = arguments.is_null() ? empty : arguments;

    for (const auto& param: definition.parameters)
    {
        auto const it = args.find(param.name);
        if (it == args.end() || it->is_null())
        {
            if (param.required)
                return makeError(ErrorCode::ValidationError,
                                 std::format("Missing required argument '{}' for '{}'", param.name, definition.name));
            continue;
        }

        if (!matchesType(param.type, *it))
            return makeError(ErrorCode::ValidationError,
                             std::format("Argument '{}' for '{}' must be of type {}, got {}",
                                         param.name,
                                         definition.name,
                                         param.type,
                                         it->type_name()));
    }

    if (!definition.allowAdditionalArguments)
    {
        for (const auto& [key, value]: args.items())
        {
            auto const known = std::ranges::any_of(definition.parameters,
                                                   [&](const ToolParameter& p) { return p.name == key; });
            if (!known)
                return makeError(ErrorCode::ValidationError,
                                 std::format("Unknown argument '{}' for '{}'", key, definition.name));
        }
    }

    return {};
}

auto parametersFromJsonSchema(const nlohmann::json& inputSchema) -> std::vector<ToolParameter>
{
    auto parameters = std::vector<ToolParameter> {};
    if (!inputSchema.is_object())
        return parameters;

    auto required = std::set<std::string> {};
    if (inputSchema.contains("required") && inputSchema["required"].is_array())
    {
        for (const auto& name: inputSchema["required"])
        {
            if (name.is_string())
                required.insert(name.get<std::string>());
        }
    }

    if (!inputSchema.contains("properties") || !inputSchema["properties"].is_object())
        return parameters;

    for (const auto& [name, property]: inputSchema["properties"].items())
    {
        auto type = std::string("any");
        if (property.is_object() && property.contains("type") && property["type"].is_string())
            type = property["type"].get<std::string>();

        parameters.push_back(ToolParameter {
            .name = name,
            .type = std::move(type),
            .description = property.is_object() ? property.value("description", "") : "",
            .required = required.contains(name),
        });
    }

    return parameters;
}

auto toJsonSchema(std::span<const ToolParameter> parameters) -> nlohmann::json
{
    auto properties = nlohmann::json::object();
    auto required = nlohmann::json::array();

    for (const auto& param: parameters)
    {
        auto property = nlohmann::json::object();
        if (param.type != "any")
            property["type"] = param.type;
        if (!param.description.empty())
            property["description"] = param.description;
        properties[param.name] = std::move(property);

        if (param.required)
            required.push_back(param.name);
    }

    return nlohmann::json {
        { "type", "object" },
        { "properties", std::move(properties) },
        { "required", std::move(required) },
    };
}

auto toCatalogEntry(const ToolDefinition& definition) -> nlohmann::json
{
    return nlohmann::json {
        { "name", definition.name },
        { "description", definition.description },
        { "parameters", toJsonSchema(definition.parameters) },
    };
}

} // namespace agentshell::schema
