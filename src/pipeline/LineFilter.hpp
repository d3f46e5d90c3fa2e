// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace novamind
{

/// @brief Where a forbidden phrase must appear for its line to be dropped.
enum class PhraseScope : std::uint8_t
{
    Prefix,   ///< The trimmed line starts with (or equals) the phrase.
    Anywhere, ///< The phrase occurs anywhere in the line.
};

/// @brief A scaffolding phrase whose lines never reach the user.
struct ForbiddenPhrase
{
    std::string phrase;
    PhraseScope scope = PhraseScope::Prefix;

    auto operator==(ForbiddenPhrase const&) const -> bool = default;
};

/// @brief Whether the per-line scan is currently inside a fenced code block.
enum class CodeBlockState : std::uint8_t
{
    OutsideCode,
    InsideCode,
};

/// @brief What happened to a single line.
enum class LineVerdict : std::uint8_t
{
    Keep,         ///< Line kept unmodified.
    Fence,        ///< Code fence delimiter, kept; toggles the code block state.
    Code,         ///< Inside a code block, kept verbatim.
    Forbidden,    ///< Matched a forbidden phrase, dropped.
    RoleStripped, ///< Role prefix removed, remainder kept.
    RoleOnly,     ///< Role prefix with nothing after it, dropped.
};

/// @brief The verdict for one line and the text that survives it (empty when dropped).
struct LineDecision
{
    LineVerdict verdict = LineVerdict::Keep;
    std::string_view text;

    [[nodiscard]] auto dropped() const noexcept -> bool
    {
        return verdict == LineVerdict::Forbidden || verdict == LineVerdict::RoleOnly;
    }
};

/// @brief Parses a scope name ("prefix" or "anywhere").
/// @return The scope, or std::nullopt for an unknown name.
[[nodiscard]] auto parsePhraseScope(std::string_view name) -> std::optional<PhraseScope>;

/// @brief Returns the config-file name of a scope.
[[nodiscard]] auto phraseScopeName(PhraseScope scope) -> std::string_view;

/// @brief Drops scaffolding lines and strips speaker-role prefixes, leaving fenced code untouched.
///
/// Rules are evaluated per line in a fixed order: code fence, code content, blank
/// line, forbidden phrase, role prefix. A line that matches both a forbidden phrase
/// and a role prefix is therefore dropped.
class LineFilter
{
  public:
    /// @brief Constructs a filter with the default phrase and role tables.
    LineFilter();

    /// @brief Constructs a filter with custom tables.
    /// @param forbidden Phrases whose lines are dropped (case-insensitive).
    /// @param roles Role names stripped from line starts (case-insensitive).
    LineFilter(std::vector<ForbiddenPhrase> forbidden, std::vector<std::string> roles);

    /// @brief Filters every line of @p text and rejoins the survivors with '\\n'.
    [[nodiscard]] auto filter(std::string_view text) const -> std::string;

    /// @brief Classifies one line, advancing @p state when the line is a code fence.
    [[nodiscard]] auto classify(std::string_view line, CodeBlockState& state) const -> LineDecision;

    [[nodiscard]] auto forbiddenPhrases() const noexcept -> std::vector<ForbiddenPhrase> const&;
    [[nodiscard]] auto roles() const noexcept -> std::vector<std::string> const&;

    [[nodiscard]] static auto defaultForbiddenPhrases() -> std::vector<ForbiddenPhrase>;
    [[nodiscard]] static auto defaultRoles() -> std::vector<std::string>;

  private:
    std::vector<ForbiddenPhrase> _forbidden;
    std::vector<std::string> _roles;

    [[nodiscard]] auto isForbidden(std::string_view trimmedLine) const -> bool;
    [[nodiscard]] auto matchRolePrefix(std::string_view trimmedLine) const -> std::size_t;
};

/// @brief Returns true if a trimmed line opens or closes a fenced code block.
[[nodiscard]] auto isCodeFence(std::string_view trimmedLine) noexcept -> bool;

} // namespace novamind
