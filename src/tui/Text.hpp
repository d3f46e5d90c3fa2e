// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace novamind::tui
{

/// @brief Wrap width used when a caller asks for a width of zero or less.
inline constexpr auto DefaultWrapWidth = 40;

/// @brief Returns the byte length of the escape sequence starting at @p pos, or 0 if
///        there is none.
///
/// Recognizes CSI sequences (ESC [ params intermediates final), OSC strings terminated
/// by BEL or ESC \\, and two-byte ESC sequences. An unterminated CSI or OSC yields 1,
/// so that only the introducer is treated as invisible.
[[nodiscard]] auto escapeSequenceLength(std::string_view text, std::size_t pos) noexcept -> std::size_t;

/// @brief Removes all escape sequences from the text.
[[nodiscard]] auto stripAnsi(std::string_view text) -> std::string;

/// @brief Returns the number of terminal columns the text occupies.
///
/// Escape sequences and control characters count zero. Each grapheme cluster counts the
/// width of its first codepoint (East Asian wide and emoji presentation characters are
/// two columns), promoted to two by a trailing VS16.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Word-wraps text so that no line is wider than @p width display columns.
///
/// Each '\\n'-separated paragraph is wrapped independently; empty and whitespace-only
/// paragraphs become empty lines. Words are split only when a single word is wider than
/// the width, at the last grapheme boundary that still fits; escape sequences are
/// never split. A width of zero or less means DefaultWrapWidth.
/// @param text The text to wrap.
/// @param width The maximum line width.
/// @return The wrapped lines (at least one).
[[nodiscard]] auto wordWrap(std::string_view text, int width) -> std::vector<std::string>;

/// @brief Truncates a string to fit within the given width, adding an ellipsis if needed.
/// @param text The text to truncate.
/// @param width The maximum width.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

} // namespace novamind::tui
