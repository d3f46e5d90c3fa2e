// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace novamind::json
{

/// @brief Parses a JSON document.
/// @return The parsed value, or a ConfigError carrying the parser's message.
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

/// @brief Looks up @p key in @p obj.
/// @return The member, or nullptr if @p obj is not an object or has no such member.
[[nodiscard]] inline auto field(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it != obj.end() ? &*it : nullptr;
}

/// @brief Returns the member @p key if it is a JSON object (a config section), else nullptr.
[[nodiscard]] inline auto getObject(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    auto const* value = field(obj, key);
    return value && value->is_object() ? value : nullptr;
}

/// @brief Returns the member @p key if it is a JSON array, else nullptr.
[[nodiscard]] inline auto getArray(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    auto const* value = field(obj, key);
    return value && value->is_array() ? value : nullptr;
}

/// @brief Reads a string member, falling back to @p defaultValue when it is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const* value = field(obj, key);
    if (value && value->is_string())
        return value->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Reads an optional string member.
[[nodiscard]] inline auto getOptionalString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto const* value = field(obj, key);
    if (value && value->is_string())
        return value->get<std::string>();
    return std::nullopt;
}

/// @brief Reads an integer member, falling back to @p defaultValue when it is missing or not an integer.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = field(obj, key);
    if (value && value->is_number_integer())
        return value->get<int>();
    return defaultValue;
}

/// @brief Reads an array of strings; non-string elements are skipped.
/// @return The strings, or std::nullopt if the member is missing or not an array.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::vector<std::string>>
{
    auto const* array = getArray(obj, key);
    if (!array)
        return std::nullopt;

    auto result = std::vector<std::string> {};
    for (auto const& item: *array)
        if (item.is_string())
            result.push_back(item.get<std::string>());
    return result;
}

} // namespace novamind::json
