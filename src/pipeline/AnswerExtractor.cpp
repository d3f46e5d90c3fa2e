// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/AnswerExtractor.hpp>

namespace novamind
{

AnswerExtractor::AnswerExtractor(std::string marker): _marker(std::move(marker))
{
}

auto AnswerExtractor::findAnswerStart(std::string_view text) const noexcept -> std::size_t
{
    if (_marker.empty())
        return std::string_view::npos;

    auto lineStart = std::size_t { 0 };
    while (lineStart <= text.size())
    {
        if (startsWithIgnoreCase(text.substr(lineStart), _marker))
        {
            auto pos = lineStart + _marker.size();
            while (pos < text.size() && isSpace(text[pos]))
                ++pos;
            return pos;
        }

        auto const newline = text.find('\n', lineStart);
        if (newline == std::string_view::npos)
            break;
        lineStart = newline + 1;
    }
    return std::string_view::npos;
}

auto AnswerExtractor::extract(std::string_view text) const -> std::string
{
    auto const start = findAnswerStart(text);
    if (start == std::string_view::npos)
        return std::string(text);

    log::debug("Answer extractor: discarding {} byte(s) before the final answer", start);
    return std::string(text.substr(start));
}

} // namespace novamind
