// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace parley::text
{

/// @brief Characters treated as surrounding whitespace (spaces, tabs and line breaks).
inline constexpr auto Whitespace = std::string_view { " \t\n\r\f\v" };

/// @brief Returns the view with leading and trailing whitespace removed.
[[nodiscard]] constexpr auto trim(std::string_view input) -> std::string_view
{
    auto const start = input.find_first_not_of(Whitespace);
    if (start == std::string_view::npos)
        return {};
    auto const end = input.find_last_not_of(Whitespace);
    return input.substr(start, end - start + 1);
}

/// @brief Returns true if the input is empty or consists of whitespace only.
[[nodiscard]] constexpr auto isBlank(std::string_view input) -> bool
{
    return trim(input).empty();
}

/// @brief Returns an ASCII-lowercased copy of the input.
[[nodiscard]] inline auto toLower(std::string_view input) -> std::string
{
    auto result = std::string(input);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // namespace parley::text
