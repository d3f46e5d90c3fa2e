// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace novamind
{

/// @brief Drops visible chain-of-thought that precedes an explicit final-answer marker.
///
/// The marker is matched case-insensitively at the start of any line. Everything up to
/// and including the first such marker (and the whitespace after it) is discarded.
/// Text without a marker passes through unchanged.
///
/// Prose that happens to precede the marker is discarded as well; the extractor cannot
/// tell reasoning from a legitimate preamble.
class AnswerExtractor
{
  public:
    static constexpr auto DefaultMarker = std::string_view { "final answer:" };

    explicit AnswerExtractor(std::string marker = std::string(DefaultMarker));

    [[nodiscard]] auto extract(std::string_view text) const -> std::string;

    /// @brief Returns the byte offset just past the marker and its trailing whitespace,
    ///        or std::string_view::npos if no line starts with the marker.
    [[nodiscard]] auto findAnswerStart(std::string_view text) const noexcept -> std::size_t;

    [[nodiscard]] auto marker() const noexcept -> std::string const& { return _marker; }

  private:
    std::string _marker;
};

} // namespace novamind
