// SPDX-License-Identifier: Apache-2.0
#include <core/StringUtils.hpp>
#include <tui/Text.hpp>

#include <libunicode/grapheme_segmenter.h>
#include <libunicode/width.h>

#include <algorithm>

namespace novamind::tui
{

namespace
{
    constexpr auto Escape = '\033';
    constexpr auto Bell = '\007';
    constexpr auto VariationSelector16 = char32_t { 0xFE0F };
    constexpr auto ReplacementCharacter = char32_t { 0xFFFD };

    struct DecodedCodepoint
    {
        char32_t codepoint = 0;
        std::size_t length = 1;
    };

    /// @brief Decodes one UTF-8 codepoint. Malformed input decodes as U+FFFD consuming one byte.
    auto decodeUtf8(std::string_view text, std::size_t pos) noexcept -> DecodedCodepoint
    {
        auto const lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80)
            return { .codepoint = lead, .length = 1 };

        auto length = std::size_t { 0 };
        auto codepoint = char32_t { 0 };
        if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            codepoint = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            codepoint = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            codepoint = lead & 0x07;
        }
        else
        {
            return { .codepoint = ReplacementCharacter, .length = 1 };
        }

        if (pos + length > text.size())
            return { .codepoint = ReplacementCharacter, .length = 1 };

        for (auto i = std::size_t { 1 }; i < length; ++i)
        {
            auto const byte = static_cast<unsigned char>(text[pos + i]);
            if ((byte & 0xC0) != 0x80)
                return { .codepoint = ReplacementCharacter, .length = 1 };
            codepoint = (codepoint << 6) | (byte & 0x3F);
        }
        return { .codepoint = codepoint, .length = length };
    }

    auto codepointWidth(char32_t codepoint) noexcept -> int
    {
        if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0))
            return 0;
        return std::max(0, static_cast<int>(unicode::width(codepoint)));
    }

    /// @brief The smallest unit the wrapper moves: an escape sequence or a grapheme cluster.
    struct TextUnit
    {
        std::size_t length = 0;
        int width = 0;
        bool escape = false;
    };

    auto nextUnit(std::string_view text, std::size_t pos) noexcept -> TextUnit
    {
        if (auto const escapeLength = escapeSequenceLength(text, pos); escapeLength > 0)
            return { .length = escapeLength, .width = 0, .escape = true };

        auto const first = decodeUtf8(text, pos);
        auto width = codepointWidth(first.codepoint);
        auto previous = first.codepoint;
        auto end = pos + first.length;

        while (end < text.size() && text[end] != Escape)
        {
            auto const next = decodeUtf8(text, end);
            if (unicode::grapheme_segmenter::breakable(previous, next.codepoint))
                break;
            if (next.codepoint == VariationSelector16 && width == 1)
                width = 2;
            previous = next.codepoint;
            end += next.length;
        }

        return { .length = end - pos, .width = width, .escape = false };
    }

    /// @brief Returns the byte offset at which an over-long word is broken so that the
    ///        head fits into @p width columns. At least one grapheme is always taken.
    auto findBreakPoint(std::string_view word, int width) noexcept -> std::size_t
    {
        auto pos = std::size_t { 0 };
        auto visible = 0;
        auto takenGrapheme = false;

        while (pos < word.size())
        {
            auto const unit = nextUnit(word, pos);
            if (!unit.escape)
            {
                if (takenGrapheme && visible + unit.width > width)
                    break;
                visible += unit.width;
                takenGrapheme = true;
            }
            pos += unit.length;
        }
        return pos;
    }
} // namespace

auto escapeSequenceLength(std::string_view text, std::size_t pos) noexcept -> std::size_t
{
    if (pos >= text.size() || text[pos] != Escape)
        return 0;
    if (pos + 1 >= text.size())
        return 1;

    auto const kind = text[pos + 1];

    // CSI: ESC [ parameter bytes (0x30-0x3F), intermediate bytes (0x20-0x2F), final byte (0x40-0x7E).
    if (kind == '[')
    {
        auto i = pos + 2;
        while (i < text.size() && text[i] >= 0x30 && text[i] <= 0x3F)
            ++i;
        while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2F)
            ++i;
        if (i < text.size() && text[i] >= 0x40 && text[i] <= 0x7E)
            return i + 1 - pos;
        return 1;
    }

    // OSC: ESC ] ... (BEL | ESC \)
    if (kind == ']')
    {
        for (auto i = pos + 2; i < text.size(); ++i)
        {
            if (text[i] == Bell)
                return i + 1 - pos;
            if (text[i] == Escape && i + 1 < text.size() && text[i + 1] == '\\')
                return i + 2 - pos;
        }
        return 1;
    }

    if (kind >= 0x20 && kind <= 0x7E)
        return 2;

    return 1;
}

auto stripAnsi(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        if (auto const escapeLength = escapeSequenceLength(text, pos); escapeLength > 0)
        {
            pos += escapeLength;
            continue;
        }
        auto const next = text.find(Escape, pos);
        auto const end = (next == std::string_view::npos) ? text.size() : next;
        result.append(text.substr(pos, end - pos));
        pos = end;
    }
    return result;
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const unit = nextUnit(text, pos);
        width += unit.width;
        pos += unit.length;
    }
    return width;
}

auto wordWrap(std::string_view text, int width) -> std::vector<std::string>
{
    if (width <= 0)
        width = DefaultWrapWidth;

    auto result = std::vector<std::string> {};

    for (auto const paragraph: splitLines(text))
    {
        auto const words = splitWords(paragraph);
        if (words.empty())
        {
            result.emplace_back();
            continue;
        }

        auto currentLine = std::string {};
        auto currentWidth = 0;

        for (auto const word: words)
        {
            auto const wordWidth = displayWidth(word);
            auto const spaceNeeded = currentLine.empty() ? 0 : 1;

            if (currentWidth + spaceNeeded + wordWidth <= width)
            {
                // Word fits on current line
                if (spaceNeeded > 0)
                    currentLine += ' ';
                currentLine += word;
                currentWidth += spaceNeeded + wordWidth;
                continue;
            }

            // Word doesn't fit: start a new line
            if (!currentLine.empty())
            {
                result.push_back(std::move(currentLine));
                currentLine.clear();
                currentWidth = 0;
            }

            if (wordWidth <= width)
            {
                currentLine = std::string(word);
                currentWidth = wordWidth;
                continue;
            }

            // The word alone is too wide: break it into chunks of at most `width` columns.
            auto remaining = word;
            while (displayWidth(remaining) > width)
            {
                auto const breakPoint = findBreakPoint(remaining, width);
                if (breakPoint >= remaining.size())
                    break;
                result.emplace_back(remaining.substr(0, breakPoint));
                remaining = remaining.substr(breakPoint);
            }
            currentLine = std::string(remaining);
            currentWidth = displayWidth(remaining);
        }

        if (!currentLine.empty())
            result.push_back(std::move(currentLine));
    }

    return result;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return "";

    if (displayWidth(text) <= width)
        return std::string(text);

    if (width <= 3)
        return std::string(static_cast<std::size_t>(width), '.');

    auto const targetWidth = width - 1; // Leave room for ellipsis
    auto result = std::string {};
    auto currentWidth = 0;
    auto pos = std::size_t { 0 };

    while (pos < text.size())
    {
        auto const unit = nextUnit(text, pos);
        if (currentWidth + unit.width > targetWidth)
            break;
        result.append(text.substr(pos, unit.length));
        currentWidth += unit.width;
        pos += unit.length;
    }

    result += "\u2026"; // …
    return result;
}

} // namespace novamind::tui
