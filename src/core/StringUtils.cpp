// SPDX-License-Identifier: Apache-2.0
#include <core/StringUtils.hpp>

#include <algorithm>

namespace novamind
{

namespace
{
    constexpr auto isContinuationByte(char ch) noexcept -> bool
    {
        return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    }

    constexpr auto lowerAscii(char ch) noexcept -> char
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    }
} // namespace

auto trimLeft(std::string_view text) noexcept -> std::string_view
{
    auto pos = std::size_t { 0 };
    while (pos < text.size() && isSpace(text[pos]))
        ++pos;
    return text.substr(pos);
}

auto trim(std::string_view text) noexcept -> std::string_view
{
    text = trimLeft(text);
    auto end = text.size();
    while (end > 0 && isSpace(text[end - 1]))
        --end;
    return text.substr(0, end);
}

auto toLower(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());
    for (auto const ch: text)
        result += lowerAscii(ch);
    return result;
}

auto startsWithIgnoreCase(std::string_view text, std::string_view prefix) noexcept -> bool
{
    if (prefix.size() > text.size())
        return false;
    return std::ranges::equal(text.substr(0, prefix.size()), prefix, [](char a, char b) {
        return lowerAscii(a) == lowerAscii(b);
    });
}

auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
{
    if (needle.empty())
        return false;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

auto normalizeForComparison(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());
    for (auto const word: splitWords(text))
    {
        if (!result.empty())
            result += ' ';
        for (auto const ch: word)
            result += lowerAscii(ch);
    }
    return result;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto result = std::vector<std::string_view> {};
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            result.push_back(text.substr(start));
            break;
        }
        result.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return result;
}

auto splitWords(std::string_view text) -> std::vector<std::string_view>
{
    auto result = std::vector<std::string_view> {};
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        auto const start = pos;
        while (pos < text.size() && !isSpace(text[pos]))
            ++pos;
        if (pos > start)
            result.push_back(text.substr(start, pos - start));
    }
    return result;
}

auto codepointCount(std::string_view text) noexcept -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char ch) { return !isContinuationByte(ch); }));
}

auto codepointPrefix(std::string_view text, std::size_t count) noexcept -> std::string_view
{
    auto seen = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        if (isContinuationByte(text[i]))
            continue;
        if (seen == count)
            return text.substr(0, i);
        ++seen;
    }
    return text;
}

} // namespace novamind
