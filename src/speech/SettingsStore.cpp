// SPDX-License-Identifier: Apache-2.0
#include "SettingsStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Text.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace parley
{

namespace
{

    auto parseDouble(std::string_view input) -> std::optional<double>
    {
        auto const trimmed = text::trim(input);
        if (trimmed.empty())
            return std::nullopt;

        auto value = 0.0;
        auto const [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
        if (ec != std::errc {} || ptr != trimmed.data() + trimmed.size() || !std::isfinite(value))
            return std::nullopt;
        return value;
    }

    auto parseInt(std::string_view input) -> std::optional<int>
    {
        auto const trimmed = text::trim(input);
        if (trimmed.empty())
            return std::nullopt;

        auto value = 0;
        auto const [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
        if (ec != std::errc {} || ptr != trimmed.data() + trimmed.size())
            return std::nullopt;
        return value;
    }

} // namespace

JsonSettingsStore::JsonSettingsStore(nlohmann::json values): _values(std::move(values))
{
    if (!_values.is_object())
        _values = nlohmann::json::object();
}

auto JsonSettingsStore::find(std::string_view key) const -> const nlohmann::json*
{
    auto const it = _values.find(std::string(key));
    if (it == _values.end() || it->is_null())
        return nullptr;
    return &*it;
}

auto JsonSettingsStore::string(std::string_view key) const -> std::optional<std::string>
{
    return json::findString(_values, key);
}

auto JsonSettingsStore::number(std::string_view key) const -> std::optional<double>
{
    auto const* value = find(key);
    if (!value)
        return std::nullopt;
    if (value->is_number())
        return value->get<double>();
    if (value->is_string())
        return parseDouble(value->get_ref<const std::string&>());
    return std::nullopt;
}

auto JsonSettingsStore::integer(std::string_view key) const -> std::optional<int>
{
    auto const* value = find(key);
    if (!value)
        return std::nullopt;
    if (value->is_number_unsigned())
    {
        auto const number = value->get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(number);
    }
    if (value->is_number_integer())
    {
        auto const number = value->get<std::int64_t>();
        if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(number);
    }
    if (value->is_string())
        return parseInt(value->get_ref<const std::string&>());
    return std::nullopt;
}

auto JsonSettingsStore::boolean(std::string_view key) const -> std::optional<bool>
{
    auto const* value = find(key);
    if (!value)
        return std::nullopt;
    if (value->is_boolean())
        return value->get<bool>();
    if (value->is_string())
    {
        auto const lower = text::toLower(text::trim(value->get_ref<const std::string&>()));
        if (lower == "true" || lower == "yes" || lower == "1")
            return true;
        if (lower == "false" || lower == "no" || lower == "0")
            return false;
    }
    return std::nullopt;
}

auto JsonSettingsStore::stringList(std::string_view key) const -> std::vector<std::string>
{
    auto const* value = find(key);
    if (!value)
        return {};
    if (value->is_array())
        return json::stringElements(*value);
    if (!value->is_string() || text::isBlank(value->get_ref<const std::string&>()))
        return {};

    auto decoded = json::parse(value->get_ref<const std::string&>());
    if (!decoded)
        return {};
    return json::stringElements(*decoded);
}

void JsonSettingsStore::set(std::string_view key, nlohmann::json value)
{
    _values[std::string(key)] = std::move(value);
}

} // namespace parley
