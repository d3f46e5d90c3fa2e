// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace novamind
{

/// @brief Tunable thresholds of the proportional (halves/thirds) repetition check.
///
/// The values are empirical; lengths count codepoints of the normalized text.
struct RepetitionThresholds
{
    std::size_t minWords = 20;           ///< Proportional checks run only above this word count.
    std::size_t minSegmentLength = 30;   ///< A half or third must be longer than this to compare.
    std::size_t halfPrefixLength = 100;  ///< Halves sharing this many leading characters match.
    std::size_t thirdPrefixLength = 80;  ///< Thirds sharing this many leading characters match.

    auto operator==(RepetitionThresholds const&) const -> bool = default;
};

/// @brief Which repetition check changed the text last.
enum class CollapseKind : std::uint8_t
{
    None,
    Lines,
    Sentences,
    Halves,
    FirstThird,
    FirstTwoThirds,
};

/// @brief Result of collapsing, for callers that want to know what fired.
struct CollapseResult
{
    std::string text;
    CollapseKind kind = CollapseKind::None;
};

/// @brief Removes verbatim repetition produced by decoding loops.
///
/// Three checks run in order:
///  1. duplicate lines (normalized), and runs of blank lines;
///  2. if at most one non-blank line remains, duplicate sentences within it;
///  3. for texts above RepetitionThresholds::minWords words, a whole-text comparison of
///     halves, then of thirds, truncating to the non-repeated prefix.
class RepetitionCollapser
{
  public:
    explicit RepetitionCollapser(RepetitionThresholds thresholds = {});

    [[nodiscard]] auto collapse(std::string_view text) const -> std::string;

    /// @brief Like collapse(), also reporting which check fired last.
    [[nodiscard]] auto collapseDetailed(std::string_view text) const -> CollapseResult;

    [[nodiscard]] auto thresholds() const noexcept -> RepetitionThresholds const& { return _thresholds; }

    /// @brief Step 1: drops duplicate lines and consecutive blank lines.
    [[nodiscard]] static auto dedupLines(std::string_view text) -> std::string;

    /// @brief Step 2: drops duplicate sentences of a single paragraph, joined by single spaces.
    [[nodiscard]] static auto dedupSentences(std::string_view text) -> std::string;

  private:
    RepetitionThresholds _thresholds;

    /// @brief Step 3: truncates a text whose halves or thirds repeat.
    /// @return The truncated text, or std::nullopt if no proportional repeat was found.
    [[nodiscard]] auto collapseProportional(std::string_view text) const -> std::optional<CollapseResult>;
};

} // namespace novamind
