// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace novamind::tui
{

/// @brief SGR sequence that starts bold text.
inline constexpr auto SgrBold = std::string_view { "\033[1m" };

/// @brief SGR sequence that resets all attributes.
inline constexpr auto SgrReset = std::string_view { "\033[0m" };

/// @brief Converts markdown bold spans into terminal bold.
///
/// Every non-overlapping `**text**` span (shortest match, at least one enclosed
/// character, no line break inside) becomes SgrBold + text + SgrReset. Unbalanced or
/// empty markers ("**", "****") are left as they are. No other markdown is
/// interpreted.
[[nodiscard]] auto renderBold(std::string_view markdown) -> std::string;

/// @brief Returns the number of bold spans renderBold() would convert.
[[nodiscard]] auto countBoldSpans(std::string_view markdown) -> std::size_t;

} // namespace novamind::tui
