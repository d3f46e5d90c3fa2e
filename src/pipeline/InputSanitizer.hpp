// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace novamind
{

/// @brief Cleans text typed by the user before it is sent to the model.
///
/// Removes C0 control characters (everything below U+0020 except newline) and DEL,
/// then trims surrounding whitespace. Multi-byte UTF-8 sequences are preserved.
[[nodiscard]] auto sanitizeInput(std::string_view text) -> std::string;

} // namespace novamind
