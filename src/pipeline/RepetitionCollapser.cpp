// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/RepetitionCollapser.hpp>

#include <span>
#include <unordered_set>
#include <vector>

namespace novamind
{

namespace
{
    constexpr auto isSentenceTerminator(char ch) noexcept -> bool
    {
        return ch == '.' || ch == '!' || ch == '?';
    }

    constexpr auto collapseKindName(CollapseKind kind) -> std::string_view
    {
        switch (kind)
        {
            case CollapseKind::None: return "none";
            case CollapseKind::Lines: return "duplicate lines";
            case CollapseKind::Sentences: return "duplicate sentences";
            case CollapseKind::Halves: return "repeated halves";
            case CollapseKind::FirstThird: return "repeated first third";
            case CollapseKind::FirstTwoThirds: return "repeated second third";
        }
        return "none";
    }

    /// @brief Lowercased, single-space joined words; the comparison key of the proportional check.
    auto lowerJoined(std::span<std::string_view const> words) -> std::string
    {
        return toLower(join(words, " "));
    }

    auto countNonBlankLines(std::string_view text) -> std::size_t
    {
        auto count = std::size_t { 0 };
        for (auto const line: splitLines(text))
            if (!trim(line).empty())
                ++count;
        return count;
    }
} // namespace

RepetitionCollapser::RepetitionCollapser(RepetitionThresholds thresholds): _thresholds(thresholds)
{
}

auto RepetitionCollapser::dedupLines(std::string_view text) -> std::string
{
    auto kept = std::vector<std::string_view> {};
    auto seen = std::unordered_set<std::string> {};

    for (auto const line: splitLines(text))
    {
        auto normalized = normalizeForComparison(line);
        if (!normalized.empty())
        {
            if (seen.insert(std::move(normalized)).second)
                kept.push_back(line);
            continue;
        }

        // One blank line separates paragraphs; more than one is runaway spacing.
        if (kept.empty() || !trim(kept.back()).empty())
            kept.push_back(line);
    }

    return join(kept, "\n");
}

auto RepetitionCollapser::dedupSentences(std::string_view text) -> std::string
{
    auto sentences = std::vector<std::string_view> {};
    auto seen = std::unordered_set<std::string> {};

    auto const addSentence = [&](std::string_view raw) {
        auto const sentence = trim(raw);
        if (!sentence.empty() && seen.insert(normalizeForComparison(sentence)).second)
            sentences.push_back(sentence);
    };

    auto start = std::size_t { 0 };
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        if (!isSentenceTerminator(text[pos]))
        {
            ++pos;
            continue;
        }

        // A run of terminators ("...", "?!") ends one sentence, and only when followed
        // by whitespace or the end of text, so "3.14" and "e.g." stay intact.
        auto end = pos;
        while (end < text.size() && isSentenceTerminator(text[end]))
            ++end;
        if (end == text.size() || isSpace(text[end]))
        {
            addSentence(text.substr(start, end - start));
            start = end;
        }
        pos = end;
    }
    addSentence(text.substr(start));

    if (sentences.empty())
        return std::string(text);
    return join(sentences, " ");
}

auto RepetitionCollapser::collapseProportional(std::string_view text) const -> std::optional<CollapseResult>
{
    auto const words = splitWords(text);
    auto const count = words.size();
    if (count <= _thresholds.minWords)
        return std::nullopt;

    auto const all = std::span<std::string_view const>(words);

    auto const half = count / 2;
    auto const firstHalf = lowerJoined(all.subspan(0, half));
    auto const secondHalf = lowerJoined(all.subspan(half, half));
    auto const firstHalfLength = codepointCount(firstHalf);

    if (firstHalfLength > _thresholds.minSegmentLength)
    {
        auto const samePrefix = firstHalfLength > _thresholds.halfPrefixLength
                                && codepointPrefix(firstHalf, _thresholds.halfPrefixLength)
                                       == codepointPrefix(secondHalf, _thresholds.halfPrefixLength);
        if (firstHalf == secondHalf || samePrefix)
            return CollapseResult { .text = join(all.subspan(0, half), " "), .kind = CollapseKind::Halves };
    }

    auto const third = count / 3;
    auto const firstThird = lowerJoined(all.subspan(0, third));
    auto const secondThird = lowerJoined(all.subspan(third, third));
    auto const lastThird = lowerJoined(all.subspan(third * 2, third));

    if (codepointCount(firstThird) <= _thresholds.minSegmentLength
        || codepointCount(secondThird) <= _thresholds.minSegmentLength)
        return std::nullopt;

    auto const prefixLength = _thresholds.thirdPrefixLength;
    if (codepointPrefix(firstThird, prefixLength) == codepointPrefix(secondThird, prefixLength))
        return CollapseResult { .text = join(all.subspan(0, third), " "), .kind = CollapseKind::FirstThird };

    if (!lastThird.empty()
        && codepointPrefix(secondThird, prefixLength) == codepointPrefix(lastThird, prefixLength))
        return CollapseResult { .text = join(all.subspan(0, third * 2), " "),
                                .kind = CollapseKind::FirstTwoThirds };

    return std::nullopt;
}

auto RepetitionCollapser::collapseDetailed(std::string_view text) const -> CollapseResult
{
    auto result = CollapseResult { .text = dedupLines(text), .kind = CollapseKind::None };
    if (result.text != text)
        result.kind = CollapseKind::Lines;

    if (countNonBlankLines(result.text) <= 1)
    {
        auto sentences = dedupSentences(result.text);
        if (normalizeForComparison(sentences) != normalizeForComparison(result.text))
            result.kind = CollapseKind::Sentences;
        result.text = std::move(sentences);
    }

    if (auto proportional = collapseProportional(result.text))
        result = std::move(*proportional);

    result.text = std::string(trim(result.text));

    if (result.kind != CollapseKind::None)
        log::debug("Repetition collapser: removed {}", collapseKindName(result.kind));

    return result;
}

auto RepetitionCollapser::collapse(std::string_view text) const -> std::string
{
    return collapseDetailed(text).text;
}

} // namespace novamind
