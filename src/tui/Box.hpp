// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace novamind::tui
{

/// @brief Border style for Box rendering.
enum class BorderStyle : std::uint8_t
{
    Single,  ///< Single line: ─ │ ┌ ┐ └ ┘
    Double,  ///< Double line: ═ ║ ╔ ╗ ╚ ╝
    Rounded, ///< Rounded corners: ─ │ ╭ ╮ ╰ ╯
    Heavy,   ///< Heavy/thick: ━ ┃ ┏ ┓ ┗ ┛
};

/// @brief Parses a border style name ("single", "double", "rounded", "heavy"), case-insensitively.
[[nodiscard]] auto parseBorderStyle(std::string_view name) -> std::optional<BorderStyle>;

/// @brief Returns the lowercase name of a border style.
[[nodiscard]] auto borderStyleName(BorderStyle style) noexcept -> std::string_view;

/// @brief Border characters for a box.
struct BorderChars
{
    std::string_view horizontal;  ///< Horizontal line (─)
    std::string_view vertical;    ///< Vertical line (│)
    std::string_view topLeft;     ///< Top-left corner (┌)
    std::string_view topRight;    ///< Top-right corner (┐)
    std::string_view bottomLeft;  ///< Bottom-left corner (└)
    std::string_view bottomRight; ///< Bottom-right corner (┘)

    /// @brief Returns the border characters for a given style.
    static auto fromStyle(BorderStyle style) noexcept -> BorderChars;
};

/// @brief Configuration of a chat bubble.
///
/// The horizontal chrome is margin + border + paddingLeft + paddingRight + border;
/// everything else of the outer width is available for text.
struct BoxConfig
{
    int width = 70;                            ///< Outer width including margin and borders
    int margin = 2;                            ///< Blank columns left of the border
    int paddingLeft = 2;                       ///< Inner padding from left border
    int paddingRight = 1;                      ///< Inner padding from right border
    int minInnerWidth = 20;                    ///< Lower bound for the text area width
    BorderStyle border = BorderStyle::Rounded; ///< Border style
    Style borderStyle;                         ///< Style for the border
    std::optional<std::string> title;          ///< Optional title in top border
    Style titleStyle;                          ///< Style for the title
};

/// @brief One laid-out content line and the spaces needed to fill the inner width.
struct BoxLine
{
    std::string text;
    int padding = 0;
};

/// @brief Wrapped and padded content of a box.
struct BoxLayout
{
    int innerWidth = 0;
    std::vector<BoxLine> lines;
};

/// @brief Returns max(minInnerWidth, outerWidth - chrome).
[[nodiscard]] constexpr auto computeInnerWidth(int outerWidth, int chrome, int minInnerWidth) noexcept -> int
{
    return std::max(minInnerWidth, outerWidth - chrome);
}

/// @brief Wraps @p text at @p innerWidth and computes the right padding of each line.
///
/// For every line displayWidth(text) + padding == innerWidth, except a forcibly split
/// grapheme wider than the inner width, whose padding is 0. An SGR attribute still
/// active at a line end is reset there and re-opened on the next line, so that the
/// border never inherits it.
[[nodiscard]] auto layoutLines(std::string_view text, int innerWidth) -> BoxLayout;

/// @brief A bordered chat bubble.
///
/// Renders a top border carrying the optional title, an empty row, the content rows,
/// another empty row, and the bottom border. Every row is outerWidth() columns wide
/// and ends with a newline.
class Box
{
  public:
    /// @brief Constructs a box with the given configuration.
    explicit Box(BoxConfig config);

    /// @brief Returns the horizontal overhead of margin, borders and paddings.
    [[nodiscard]] auto chrome() const noexcept -> int;

    /// @brief Returns the inner width (content area width after borders and padding).
    [[nodiscard]] auto innerWidth() const noexcept -> int;

    /// @brief Returns the width of every rendered row.
    [[nodiscard]] auto outerWidth() const noexcept -> int;

    /// @brief Converts bold markdown, wraps and pads @p text for this box.
    [[nodiscard]] auto layout(std::string_view text) const -> BoxLayout;

    /// @brief Renders the complete bubble around @p layout.
    /// @param output The terminal output to render to.
    /// @param layout Lines produced by layout() (or layoutLines() with innerWidth()).
    void render(TerminalOutput& output, BoxLayout const& layout) const;

    /// @brief Returns the current configuration.
    [[nodiscard]] auto config() const noexcept -> BoxConfig const&;

  private:
    BoxConfig _config;

    void renderTopBorder(TerminalOutput& output, BorderChars const& chars) const;
    void renderEmptyRow(TerminalOutput& output, BorderChars const& chars) const;
    void renderContentRow(TerminalOutput& output, BorderChars const& chars, BoxLine const& line) const;
    void renderBottomBorder(TerminalOutput& output, BorderChars const& chars) const;
    void renderMargin(TerminalOutput& output) const;
};

} // namespace novamind::tui
