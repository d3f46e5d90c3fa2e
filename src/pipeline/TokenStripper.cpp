// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/TokenStripper.hpp>

#include <array>

namespace novamind
{

namespace
{
    constexpr auto DefaultTokens = std::array<std::string_view, 14> {
        "<|im_start|>system",
        "<|im_start|>user",
        "<|im_start|>assistant",
        "<|im_start|>",
        "<|im_end|>",
        "<|im_sep|>",
        "[INST]",
        "[/INST]",
        "<<SYS>>",
        "<</SYS>>",
        "<s>",
        "</s>",
        "<|end|>",
        "<|assistant|>",
    };

    /// @brief Removes every occurrence of @p token in place.
    /// @return The number of occurrences removed.
    auto eraseAll(std::string& text, std::string_view token) -> std::size_t
    {
        auto count = std::size_t { 0 };
        auto pos = text.find(token);
        while (pos != std::string::npos)
        {
            text.erase(pos, token.size());
            ++count;
            pos = text.find(token, pos);
        }
        return count;
    }

    /// @brief Replaces every run of at least @p minRun copies of @p ch with @p keep copies.
    auto collapseRuns(std::string_view text, char ch, std::size_t minRun, std::size_t keep) -> std::string
    {
        auto result = std::string {};
        result.reserve(text.size());

        auto pos = std::size_t { 0 };
        while (pos < text.size())
        {
            if (text[pos] != ch)
            {
                result += text[pos++];
                continue;
            }

            auto run = std::size_t { 0 };
            while (pos < text.size() && text[pos] == ch)
            {
                ++run;
                ++pos;
            }
            result.append(run >= minRun ? keep : run, ch);
        }
        return result;
    }
} // namespace

TokenStripper::TokenStripper():
    _tokens(DefaultTokens.begin(), DefaultTokens.end())
{
}

TokenStripper::TokenStripper(std::vector<std::string> tokens): _tokens(std::move(tokens))
{
    std::erase_if(_tokens, [](std::string const& token) { return token.empty(); });
}

auto TokenStripper::strip(std::string_view text) const -> std::string
{
    if (text.empty())
        return {};

    auto result = std::string(text);

    // Removing one token can join the halves of another ("<|im_<s>end|>"), so repeat
    // until a full pass removes nothing. Each productive pass shrinks the text.
    auto removedInPass = std::size_t { 0 };
    do
    {
        removedInPass = 0;
        for (auto const& token: _tokens)
        {
            auto const removed = eraseAll(result, token);
            if (removed > 0)
                log::trace("Stripped {} occurrence(s) of token {}", removed, token);
            removedInPass += removed;
        }
    } while (removedInPass > 0);

    result = collapseRuns(result, '\n', 3, 2);
    result = collapseRuns(result, ' ', 2, 1);
    return std::string(trim(result));
}

auto TokenStripper::tokens() const noexcept -> std::vector<std::string> const&
{
    return _tokens;
}

auto TokenStripper::defaultTokens() -> std::span<std::string_view const>
{
    return DefaultTokens;
}

} // namespace novamind
