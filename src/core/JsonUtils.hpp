// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace parley::json
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
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional string field, without a default.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value, or std::nullopt if missing or not a string.
[[nodiscard]] inline auto findString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::nullopt;
}

/// @brief Collects the string elements of a JSON array, skipping anything else.
/// @param array The JSON value; non-arrays yield an empty vector.
/// @return The string elements in order.
[[nodiscard]] inline auto stringElements(const nlohmann::json& array) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    if (!array.is_array())
        return result;

    for (const auto& element: array)
    {
        if (element.is_string())
            result.push_back(element.get<std::string>());
    }
    return result;
}

} // namespace parley::json
