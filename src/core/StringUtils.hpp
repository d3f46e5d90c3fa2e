// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace novamind
{

/// @brief Returns true for the ASCII whitespace characters (space, \\t, \\n, \\v, \\f, \\r).
[[nodiscard]] constexpr auto isSpace(char ch) noexcept -> bool
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

/// @brief Strips leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view;

/// @brief Strips leading whitespace.
[[nodiscard]] auto trimLeft(std::string_view text) noexcept -> std::string_view;

/// @brief Lowercases ASCII letters; other bytes (including UTF-8 sequences) are copied as-is.
[[nodiscard]] auto toLower(std::string_view text) -> std::string;

/// @brief Case-insensitive (ASCII) prefix test.
[[nodiscard]] auto startsWithIgnoreCase(std::string_view text, std::string_view prefix) noexcept -> bool;

/// @brief Case-insensitive (ASCII) substring test. An empty needle is never found.
[[nodiscard]] auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool;

/// @brief Comparison key for duplicate detection: lowercased, whitespace runs collapsed to
///        one space, leading and trailing whitespace removed.
[[nodiscard]] auto normalizeForComparison(std::string_view text) -> std::string;

/// @brief Splits on '\\n'. Always yields at least one element; empty segments are kept.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>;

/// @brief Splits on whitespace runs, dropping empty tokens.
[[nodiscard]] auto splitWords(std::string_view text) -> std::vector<std::string_view>;

/// @brief Joins the given pieces with a separator.
template <typename Container>
[[nodiscard]] auto join(Container const& pieces, std::string_view separator) -> std::string
{
    auto result = std::string {};
    auto first = true;
    for (auto const& piece: pieces)
    {
        if (!first)
            result += separator;
        result += piece;
        first = false;
    }
    return result;
}

/// @brief Number of UTF-8 codepoints (lead bytes) in the text.
[[nodiscard]] auto codepointCount(std::string_view text) noexcept -> std::size_t;

/// @brief Returns the longest prefix holding at most @p count codepoints.
[[nodiscard]] auto codepointPrefix(std::string_view text, std::size_t count) noexcept -> std::string_view;

} // namespace novamind
