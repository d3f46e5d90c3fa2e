// SPDX-License-Identifier: Apache-2.0
#include <core/StringUtils.hpp>
#include <tui/Box.hpp>
#include <tui/MarkdownRenderer.hpp>
#include <tui/Text.hpp>

#include <algorithm>

namespace novamind::tui
{

namespace
{
    auto repeat(std::string_view piece, int count) -> std::string
    {
        auto result = std::string {};
        if (count <= 0)
            return result;
        result.reserve(piece.size() * static_cast<std::size_t>(count));
        for (auto i = 0; i < count; ++i)
            result += piece;
        return result;
    }

    auto isSgrReset(std::string_view sequence) noexcept -> bool
    {
        return sequence == "\033[m" || sequence == "\033[0m";
    }

    /// @brief Tracks the SGR attributes active after @p line, starting from @p active.
    void trackSgr(std::string_view line, std::string& active)
    {
        auto pos = std::size_t { 0 };
        while (pos < line.size())
        {
            auto const length = escapeSequenceLength(line, pos);
            if (length == 0)
            {
                ++pos;
                continue;
            }
            auto const sequence = line.substr(pos, length);
            if (isSgrReset(sequence))
                active.clear();
            else if (sequence.size() > 2 && sequence[1] == '[' && sequence.back() == 'm')
                active += sequence;
            pos += length;
        }
    }
} // namespace

auto parseBorderStyle(std::string_view name) -> std::optional<BorderStyle>
{
    auto const lowered = toLower(trim(name));
    if (lowered == "single")
        return BorderStyle::Single;
    if (lowered == "double")
        return BorderStyle::Double;
    if (lowered == "rounded")
        return BorderStyle::Rounded;
    if (lowered == "heavy")
        return BorderStyle::Heavy;
    return std::nullopt;
}

auto borderStyleName(BorderStyle style) noexcept -> std::string_view
{
    switch (style)
    {
        case BorderStyle::Single: return "single";
        case BorderStyle::Double: return "double";
        case BorderStyle::Rounded: return "rounded";
        case BorderStyle::Heavy: return "heavy";
    }
    return "rounded";
}

auto BorderChars::fromStyle(BorderStyle style) noexcept -> BorderChars
{
    switch (style)
    {
        case BorderStyle::Single:
            return BorderChars {
                .horizontal = "\u2500",  // ─
                .vertical = "\u2502",    // │
                .topLeft = "\u250C",     // ┌
                .topRight = "\u2510",    // ┐
                .bottomLeft = "\u2514",  // └
                .bottomRight = "\u2518", // ┘
            };
        case BorderStyle::Double:
            return BorderChars {
                .horizontal = "\u2550",  // ═
                .vertical = "\u2551",    // ║
                .topLeft = "\u2554",     // ╔
                .topRight = "\u2557",    // ╗
                .bottomLeft = "\u255A",  // ╚
                .bottomRight = "\u255D", // ╝
            };
        case BorderStyle::Rounded:
            return BorderChars {
                .horizontal = "\u2500",  // ─
                .vertical = "\u2502",    // │
                .topLeft = "\u256D",     // ╭
                .topRight = "\u256E",    // ╮
                .bottomLeft = "\u2570",  // ╰
                .bottomRight = "\u256F", // ╯
            };
        case BorderStyle::Heavy:
            return BorderChars {
                .horizontal = "\u2501",  // ━
                .vertical = "\u2503",    // ┃
                .topLeft = "\u250F",     // ┏
                .topRight = "\u2513",    // ┓
                .bottomLeft = "\u2517",  // ┗
                .bottomRight = "\u251B", // ┛
            };
    }
    return fromStyle(BorderStyle::Rounded);
}

auto layoutLines(std::string_view text, int innerWidth) -> BoxLayout
{
    auto layout = BoxLayout { .innerWidth = innerWidth, .lines = {} };
    auto active = std::string {};

    for (auto& wrapped: wordWrap(text, innerWidth))
    {
        auto line = active + wrapped;
        trackSgr(wrapped, active);
        if (!active.empty())
            line += SgrReset;

        auto const padding = std::max(0, innerWidth - displayWidth(line));
        layout.lines.push_back(BoxLine { .text = std::move(line), .padding = padding });
    }
    return layout;
}

Box::Box(BoxConfig config): _config(std::move(config))
{
}

auto Box::chrome() const noexcept -> int
{
    return _config.margin + 1 + _config.paddingLeft + _config.paddingRight + 1;
}

auto Box::innerWidth() const noexcept -> int
{
    return computeInnerWidth(_config.width, chrome(), _config.minInnerWidth);
}

auto Box::outerWidth() const noexcept -> int
{
    return innerWidth() + chrome();
}

auto Box::layout(std::string_view text) const -> BoxLayout
{
    return layoutLines(renderBold(text), innerWidth());
}

void Box::render(TerminalOutput& output, BoxLayout const& layout) const
{
    auto const chars = BorderChars::fromStyle(_config.border);

    renderTopBorder(output, chars);
    renderEmptyRow(output, chars);
    for (auto const& line: layout.lines)
        renderContentRow(output, chars, line);
    renderEmptyRow(output, chars);
    renderBottomBorder(output, chars);
}

void Box::renderMargin(TerminalOutput& output) const
{
    output.writeRaw(std::string(static_cast<std::size_t>(std::max(0, _config.margin)), ' '));
}

void Box::renderTopBorder(TerminalOutput& output, BorderChars const& chars) const
{
    renderMargin(output);

    // Columns between the two corners.
    auto const span = outerWidth() - _config.margin - 2;

    // "─ " + title + " " needs three columns besides the title; keep at least one fill column.
    auto const maxTitleWidth = span - 4;
    if (!_config.title || _config.title->empty() || maxTitleWidth <= 0)
    {
        output.write(std::string(chars.topLeft) + repeat(chars.horizontal, span) + std::string(chars.topRight),
                     _config.borderStyle);
        output.writeRaw("\n");
        return;
    }

    auto const title = truncate(*_config.title, maxTitleWidth);
    auto const fill = span - 3 - displayWidth(title);

    output.write(std::string(chars.topLeft) + std::string(chars.horizontal) + " ", _config.borderStyle);
    output.write(title, _config.titleStyle);
    output.write(" " + repeat(chars.horizontal, fill) + std::string(chars.topRight), _config.borderStyle);
    output.writeRaw("\n");
}

void Box::renderEmptyRow(TerminalOutput& output, BorderChars const& chars) const
{
    renderMargin(output);
    output.write(chars.vertical, _config.borderStyle);
    output.writeRaw(std::string(static_cast<std::size_t>(outerWidth() - _config.margin - 2), ' '));
    output.write(chars.vertical, _config.borderStyle);
    output.writeRaw("\n");
}

void Box::renderContentRow(TerminalOutput& output, BorderChars const& chars, BoxLine const& line) const
{
    renderMargin(output);
    output.write(chars.vertical, _config.borderStyle);
    output.writeRaw(std::string(static_cast<std::size_t>(_config.paddingLeft), ' '));
    output.writeRaw(line.text);
    output.writeRaw(std::string(static_cast<std::size_t>(line.padding + _config.paddingRight), ' '));
    output.write(chars.vertical, _config.borderStyle);
    output.writeRaw("\n");
}

void Box::renderBottomBorder(TerminalOutput& output, BorderChars const& chars) const
{
    renderMargin(output);
    auto const span = outerWidth() - _config.margin - 2;
    output.write(std::string(chars.bottomLeft) + repeat(chars.horizontal, span) + std::string(chars.bottomRight),
                 _config.borderStyle);
    output.writeRaw("\n");
}

auto Box::config() const noexcept -> BoxConfig const&
{
    return _config;
}

} // namespace novamind::tui
