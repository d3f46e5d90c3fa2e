// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/OutputPipeline.hpp>

namespace novamind
{

auto defaultTokenList() -> std::vector<std::string>
{
    auto const tokens = TokenStripper::defaultTokens();
    return { tokens.begin(), tokens.end() };
}

OutputPipeline::OutputPipeline(PipelineConfig config):
    _config(std::move(config)),
    _stripper(_config.tokens),
    _lineFilter(_config.forbiddenPhrases, _config.roles),
    _answerExtractor(_config.finalAnswerMarker),
    _collapser(_config.repetition)
{
}

auto OutputPipeline::sanitize(std::string_view raw) const -> std::string
{
    auto text = _stripper.strip(raw);
    text = _lineFilter.filter(text);
    text = _answerExtractor.extract(text);
    text = _collapser.collapse(text);
    auto result = std::string(trim(text));

    log::debug("Sanitized {} bytes into {} bytes", raw.size(), result.size());
    return result;
}

auto OutputPipeline::render(std::string_view sanitized, int outerWidth) const -> tui::BoxLayout
{
    return box(outerWidth).layout(sanitized);
}

auto OutputPipeline::process(std::string_view raw, int outerWidth) const -> tui::BoxLayout
{
    return render(sanitize(raw), outerWidth);
}

auto OutputPipeline::box(int outerWidth) const -> tui::Box
{
    auto boxConfig = _config.box;
    boxConfig.width = outerWidth;
    return tui::Box(std::move(boxConfig));
}

} // namespace novamind
