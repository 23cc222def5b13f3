// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace agentshell::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or a ValidationError.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ValidationError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field, saturated to the range of `int`.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    constexpr auto Min = std::numeric_limits<int>::min();
    constexpr auto Max = std::numeric_limits<int>::max();

    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_number_integer())
        return defaultValue;

    auto const& value = obj[keyStr];
    if (value.is_number_unsigned())
        return static_cast<int>(std::min<std::uint64_t>(value.get<std::uint64_t>(), Max));
    return static_cast<int>(std::clamp<std::int64_t>(value.get<std::int64_t>(), Min, Max));
}

[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<float>();
    return defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional array of strings; non-string elements are skipped.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The strings, or an empty vector if the field is missing or not an array.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return values;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts an optional object of string values; non-string values are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return values;

    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

} // namespace agentshell::json
