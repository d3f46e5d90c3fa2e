// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace novamind::tui
{

/// @brief 24-bit color, emitted as `38;2;r;g;b` / `48;2;r;g;b`.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Terminal color: unset (terminal default), 256-palette index, or 24-bit RGB.
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Attributes applied to one write(); a default-constructed Style emits no escapes.
struct Style
{
    Color fg;               ///< Foreground color.
    Color bg;               ///< Background color.
    bool bold = false;      ///< Bold text.
    bool italic = false;    ///< Italic text.
    bool underline = false; ///< Underlined text.
    bool dim = false;       ///< Dim/faint text.
};

/// @brief Buffered, styled output to a terminal file descriptor.
///
/// Text is collected in an internal buffer and written on flush(). The terminal
/// size is queried with TIOCGWINSZ; when the descriptor is not a terminal the
/// defaults (80x24) are kept.
class TerminalOutput
{
  public:
    static constexpr auto DefaultColumns = 80;
    static constexpr auto DefaultRows = 24;

    /// @brief Creates an output writing to @p fd (standard output by default).
    explicit TerminalOutput(int fd = 1);

    /// @brief Queries the terminal dimensions.
    /// @return Success; a descriptor that is not a terminal is not an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text. A non-default style is reset right after the text.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text (which may carry its own escape sequences).
    void writeRaw(std::string_view text);

    /// @brief Writes the buffer to the file descriptor and clears it.
    /// @return Success or IoError if the descriptor rejects the data.
    [[nodiscard]] auto flush() -> VoidResult;

    /// @brief Returns the buffered, not yet flushed output.
    [[nodiscard]] auto buffer() const noexcept -> std::string_view;

    /// @brief Width in columns; the CLI clamps the bubble to this. DefaultColumns unless TIOCGWINSZ answered.
    [[nodiscard]] auto columns() const noexcept -> int;

    /// @brief Height in rows; DefaultRows unless TIOCGWINSZ answered.
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Returns true if the descriptor refers to a terminal.
    [[nodiscard]] auto isTerminal() const noexcept -> bool;

    /// @brief Re-queries the window size; keeps the previous values on failure.
    void updateDimensions();

  private:
    int _fd;
    std::string _buffer; ///< Pending bytes, written by flush().
    int _cols = DefaultColumns;
    int _rows = DefaultRows;

    /// @brief Opens @p style with one combined SGR sequence.
    /// @return true if anything was appended.
    auto appendSgr(Style const& style) -> bool;

    /// @brief Closes a style opened by appendSgr().
    void appendSgrReset();
};

} // namespace novamind::tui
