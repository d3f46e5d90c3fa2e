// SPDX-License-Identifier: Apache-2.0
#include <tui/MarkdownRenderer.hpp>

namespace novamind::tui
{

namespace
{
    constexpr auto BoldMarker = std::string_view { "**" };

    struct BoldSpan
    {
        std::size_t open = std::string_view::npos; ///< Offset of the opening marker.
        std::size_t close = 0;                     ///< Offset of the closing marker.
    };

    /// @brief Finds the next `**...**` span starting at or after @p pos.
    auto findBoldSpan(std::string_view text, std::size_t pos) -> BoldSpan
    {
        while (true)
        {
            auto const open = text.find(BoldMarker, pos);
            if (open == std::string_view::npos)
                return {};

            // The enclosed text holds at least one character, so the closing marker
            // is searched from one past the first content byte.
            auto const contentStart = open + BoldMarker.size();
            auto const close = text.find(BoldMarker, contentStart + 1);
            auto const lineEnd = text.find('\n', contentStart);

            if (close != std::string_view::npos && (lineEnd == std::string_view::npos || lineEnd >= close))
                return { .open = open, .close = close };

            // No match opening here; a match may still open one byte later ("***a**").
            pos = open + 1;
        }
    }
} // namespace

auto renderBold(std::string_view markdown) -> std::string
{
    auto result = std::string {};
    result.reserve(markdown.size() + 16);

    auto pos = std::size_t { 0 };
    while (pos < markdown.size())
    {
        auto const span = findBoldSpan(markdown, pos);
        if (span.open == std::string_view::npos)
        {
            result.append(markdown.substr(pos));
            break;
        }

        auto const contentStart = span.open + BoldMarker.size();
        result.append(markdown.substr(pos, span.open - pos));
        result.append(SgrBold);
        result.append(markdown.substr(contentStart, span.close - contentStart));
        result.append(SgrReset);
        pos = span.close + BoldMarker.size();
    }

    return result;
}

auto countBoldSpans(std::string_view markdown) -> std::size_t
{
    auto count = std::size_t { 0 };
    auto pos = std::size_t { 0 };
    while (true)
    {
        auto const span = findBoldSpan(markdown, pos);
        if (span.open == std::string_view::npos)
            return count;
        ++count;
        pos = span.close + BoldMarker.size();
    }
}

} // namespace novamind::tui
