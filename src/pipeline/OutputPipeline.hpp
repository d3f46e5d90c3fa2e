// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/AnswerExtractor.hpp>
#include <pipeline/LineFilter.hpp>
#include <pipeline/RepetitionCollapser.hpp>
#include <pipeline/TokenStripper.hpp>
#include <tui/Box.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace novamind
{

/// @brief Returns the built-in token list as owned strings.
[[nodiscard]] auto defaultTokenList() -> std::vector<std::string>;

/// @brief Everything the output pipeline can be tuned with.
struct PipelineConfig
{
    std::vector<std::string> tokens = defaultTokenList();
    std::vector<ForbiddenPhrase> forbiddenPhrases = LineFilter::defaultForbiddenPhrases();
    std::vector<std::string> roles = LineFilter::defaultRoles();
    std::string finalAnswerMarker = std::string(AnswerExtractor::DefaultMarker);
    RepetitionThresholds repetition;
    tui::BoxConfig box;
};

/// @brief Turns raw model output into framed terminal lines.
///
/// The sanitization stage strips template tokens, filters scaffolding lines, cuts
/// leading reasoning at the final-answer marker and collapses repetition. The
/// rendering stage converts bold markdown, wraps by display width and pads every line
/// to the inner width of the box. Both stages are pure: the pipeline holds nothing
/// but its configuration and may be used from several threads at once.
class OutputPipeline
{
  public:
    explicit OutputPipeline(PipelineConfig config = {});

    /// @brief Runs the sanitization stage. The result is trimmed.
    [[nodiscard]] auto sanitize(std::string_view raw) const -> std::string;

    /// @brief Runs the rendering stage for a box @p outerWidth columns wide.
    [[nodiscard]] auto render(std::string_view sanitized, int outerWidth) const -> tui::BoxLayout;

    /// @brief Runs both stages.
    [[nodiscard]] auto process(std::string_view raw, int outerWidth) const -> tui::BoxLayout;

    /// @brief Returns the box that render() lays out for, with the given outer width.
    [[nodiscard]] auto box(int outerWidth) const -> tui::Box;

    [[nodiscard]] auto config() const noexcept -> PipelineConfig const& { return _config; }

  private:
    PipelineConfig _config;
    TokenStripper _stripper;
    LineFilter _lineFilter;
    AnswerExtractor _answerExtractor;
    RepetitionCollapser _collapser;
};

} // namespace novamind
