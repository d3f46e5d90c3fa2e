// SPDX-License-Identifier: Apache-2.0
#include <core/StringUtils.hpp>
#include <pipeline/InputSanitizer.hpp>

namespace novamind
{

auto sanitizeInput(std::string_view text) -> std::string
{
    auto cleaned = std::string {};
    cleaned.reserve(text.size());

    // C0 controls and DEL are single bytes in UTF-8 and never occur inside a sequence.
    for (auto const ch: text)
    {
        auto const byte = static_cast<unsigned char>(ch);
        if (ch == '\n' || (byte >= 0x20 && byte != 0x7F))
            cleaned += ch;
    }

    return std::string(trim(cleaned));
}

} // namespace novamind
