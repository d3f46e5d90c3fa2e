// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <utility>
#include <vector>

#include <unistd.h>

#include <core/StringUtils.hpp>
#include <tui/TerminalOutput.hpp>

namespace novamind::tui
{

TerminalOutput::TerminalOutput(int fd): _fd(fd)
{
}

auto TerminalOutput::initialize() -> VoidResult
{
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    auto const styled = appendSgr(style);
    _buffer.append(text);
    if (styled)
        appendSgrReset();
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

auto TerminalOutput::flush() -> VoidResult
{
    auto offset = std::size_t { 0 };
    while (offset < _buffer.size())
    {
        auto const written = ::write(_fd, _buffer.data() + offset, _buffer.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            auto const reason = std::string(std::strerror(errno));
            _buffer.clear();
            return makeError(ErrorCode::IoError, std::format("Failed to write to terminal: {}", reason));
        }
        offset += static_cast<std::size_t>(written);
    }
    _buffer.clear();
    return {};
}

auto TerminalOutput::buffer() const noexcept -> std::string_view
{
    return _buffer;
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

auto TerminalOutput::isTerminal() const noexcept -> bool
{
    return ::isatty(_fd) == 1;
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

auto TerminalOutput::appendSgr(Style const& style) -> bool
{
    auto params = std::vector<std::string> {};

    for (auto const& [enabled, code]: { std::pair { style.bold, "1" },
                                        std::pair { style.dim, "2" },
                                        std::pair { style.italic, "3" },
                                        std::pair { style.underline, "4" } })
    {
        if (enabled)
            params.emplace_back(code);
    }

    // 38 selects the foreground, 48 the background.
    for (auto const& [color, selector]: { std::pair { &style.fg, 38 }, std::pair { &style.bg, 48 } })
    {
        if (auto const* index = std::get_if<std::uint8_t>(color))
            params.push_back(std::format("{};5;{}", selector, *index));
        else if (auto const* rgb = std::get_if<RgbColor>(color))
            params.push_back(std::format("{};2;{};{};{}", selector, rgb->r, rgb->g, rgb->b));
    }

    if (params.empty())
        return false;

    _buffer += "\033[";
    _buffer += join(params, ";");
    _buffer += 'm';
    return true;
}

void TerminalOutput::appendSgrReset()
{
    _buffer += "\033[m";
}

} // namespace novamind::tui
