// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/LineFilter.hpp>

namespace novamind
{

namespace
{
    constexpr auto CodeFence = std::string_view { "```" };
} // namespace

auto parsePhraseScope(std::string_view name) -> std::optional<PhraseScope>
{
    if (name == "prefix")
        return PhraseScope::Prefix;
    if (name == "anywhere")
        return PhraseScope::Anywhere;
    return std::nullopt;
}

auto phraseScopeName(PhraseScope scope) -> std::string_view
{
    switch (scope)
    {
        case PhraseScope::Prefix: return "prefix";
        case PhraseScope::Anywhere: return "anywhere";
    }
    return "prefix";
}

auto isCodeFence(std::string_view trimmedLine) noexcept -> bool
{
    // An info string may follow the fence ("```python").
    return trimmedLine.starts_with(CodeFence);
}

LineFilter::LineFilter(): LineFilter(defaultForbiddenPhrases(), defaultRoles())
{
}

LineFilter::LineFilter(std::vector<ForbiddenPhrase> forbidden, std::vector<std::string> roles):
    _forbidden(std::move(forbidden)), _roles(std::move(roles))
{
    std::erase_if(_forbidden, [](ForbiddenPhrase const& entry) { return entry.phrase.empty(); });
    std::erase_if(_roles, [](std::string const& role) { return role.empty(); });
}

auto LineFilter::defaultForbiddenPhrases() -> std::vector<ForbiddenPhrase>
{
    return {
        { .phrase = "The user is asking", .scope = PhraseScope::Prefix },
        { .phrase = "System:", .scope = PhraseScope::Prefix },
        { .phrase = "Developer:", .scope = PhraseScope::Prefix },
        { .phrase = "Instruction:", .scope = PhraseScope::Prefix },
        { .phrase = "You are ChatGPT", .scope = PhraseScope::Prefix },
        { .phrase = "You are an AI", .scope = PhraseScope::Prefix },
        { .phrase = "<|im_start|>", .scope = PhraseScope::Anywhere },
        { .phrase = "<|im_end|>", .scope = PhraseScope::Anywhere },
        { .phrase = "----", .scope = PhraseScope::Prefix },
        { .phrase = "[SUGGESTION]", .scope = PhraseScope::Prefix },
        { .phrase = "[THOUGHT]", .scope = PhraseScope::Anywhere },
        { .phrase = "[DEBUG]", .scope = PhraseScope::Anywhere },
    };
}

auto LineFilter::defaultRoles() -> std::vector<std::string>
{
    return { "System", "Assistant", "User", "NovaMind", "AI", "Model" };
}

auto LineFilter::forbiddenPhrases() const noexcept -> std::vector<ForbiddenPhrase> const&
{
    return _forbidden;
}

auto LineFilter::roles() const noexcept -> std::vector<std::string> const&
{
    return _roles;
}

auto LineFilter::filter(std::string_view text) const -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto state = CodeBlockState::OutsideCode;
    auto first = true;
    auto dropped = 0;

    for (auto const line: splitLines(text))
    {
        auto const decision = classify(line, state);
        if (decision.dropped())
        {
            ++dropped;
            continue;
        }

        if (!first)
            result += '\n';
        result += decision.text;
        first = false;
    }

    if (state == CodeBlockState::InsideCode)
        log::debug("Line filter: response ends inside an unterminated code block");
    if (dropped > 0)
        log::debug("Line filter: dropped {} scaffolding line(s)", dropped);

    return result;
}

auto LineFilter::classify(std::string_view line, CodeBlockState& state) const -> LineDecision
{
    auto const trimmed = trim(line);

    if (isCodeFence(trimmed))
    {
        state = (state == CodeBlockState::InsideCode) ? CodeBlockState::OutsideCode : CodeBlockState::InsideCode;
        return { .verdict = LineVerdict::Fence, .text = line };
    }

    if (state == CodeBlockState::InsideCode)
        return { .verdict = LineVerdict::Code, .text = line };

    if (trimmed.empty())
        return { .verdict = LineVerdict::Keep, .text = line };

    if (isForbidden(trimmed))
    {
        log::trace("Line filter: dropping forbidden line \"{}\"", trimmed);
        return { .verdict = LineVerdict::Forbidden, .text = {} };
    }

    auto const start = trimLeft(line);
    if (auto const prefixLength = matchRolePrefix(start); prefixLength > 0)
    {
        auto const content = start.substr(prefixLength);
        if (trim(content).empty())
            return { .verdict = LineVerdict::RoleOnly, .text = {} };
        return { .verdict = LineVerdict::RoleStripped, .text = content };
    }

    return { .verdict = LineVerdict::Keep, .text = line };
}

auto LineFilter::isForbidden(std::string_view trimmedLine) const -> bool
{
    for (auto const& entry: _forbidden)
    {
        switch (entry.scope)
        {
            case PhraseScope::Prefix:
                if (startsWithIgnoreCase(trimmedLine, entry.phrase))
                    return true;
                break;
            case PhraseScope::Anywhere:
                if (containsIgnoreCase(trimmedLine, entry.phrase))
                    return true;
                break;
        }
    }
    return false;
}

/// Returns the length of the role prefix at the start of @p line, including the colon
/// and the whitespace after it, or 0 if the line does not start with a role.
auto LineFilter::matchRolePrefix(std::string_view line) const -> std::size_t
{
    for (auto const& role: _roles)
    {
        if (!startsWithIgnoreCase(line, role))
            continue;

        auto const rest = line.substr(role.size());
        if (rest.starts_with(':'))
            return line.size() - trimLeft(rest.substr(1)).size();

        // A bare role name ("Assistant") consumes the whole line.
        if (trim(rest).empty())
            return line.size();
    }
    return 0;
}

} // namespace novamind
