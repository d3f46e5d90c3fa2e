// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace novamind
{

/// @brief Removes literal chat-template markers (ChatML, Llama/Mistral, Phi) from model output.
///
/// Tokens are removed in list order, so longer variants such as "<|im_start|>assistant"
/// must precede their prefixes. Removal repeats until none of the tokens occurs, then
/// newline runs of three or more collapse to two, space runs collapse to one, and the
/// result is trimmed.
class TokenStripper
{
  public:
    /// @brief Constructs a stripper with the default token list.
    TokenStripper();

    /// @brief Constructs a stripper with a custom token list. Empty tokens are ignored.
    explicit TokenStripper(std::vector<std::string> tokens);

    /// @brief Strips all tokens from @p text.
    [[nodiscard]] auto strip(std::string_view text) const -> std::string;

    /// @brief Returns the configured tokens.
    [[nodiscard]] auto tokens() const noexcept -> std::vector<std::string> const&;

    /// @brief Returns the built-in token list.
    [[nodiscard]] static auto defaultTokens() -> std::span<std::string_view const>;

  private:
    std::vector<std::string> _tokens;
};

} // namespace novamind
