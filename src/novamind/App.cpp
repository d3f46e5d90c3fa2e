// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <pipeline/InputSanitizer.hpp>
#include <pipeline/OutputPipeline.hpp>
#include <tui/Box.hpp>
#include <tui/TerminalOutput.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace novamind
{

namespace
{
    /// @brief Columns kept free right of the bubble.
    constexpr auto TerminalMargin = 4;

    auto borderStyle() -> tui::Style
    {
        auto style = tui::Style {};
        style.fg = static_cast<std::uint8_t>(6); // Cyan border
        return style;
    }

    auto titleStyle() -> tui::Style
    {
        auto style = tui::Style {};
        style.fg = static_cast<std::uint8_t>(6);
        style.bold = true;
        return style;
    }
} // namespace

auto readInput(std::string const& path) -> Result<std::string>
{
    if (path.empty() || path == "-")
    {
        auto content = std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        if (std::cin.bad())
            return makeError(ErrorCode::IoError, "Failed to read standard input");
        return content;
    }

    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open input file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Failed to read input file: {}", path));
    return ss.str();
}

struct App::Impl
{
    AppConfig config;
    tui::TerminalOutput output;
    std::optional<OutputPipeline> pipeline;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    /// @brief Returns the outer bubble width: the requested or configured width, clamped to the terminal.
    [[nodiscard]] auto effectiveWidth(std::optional<int> requested) const -> int
    {
        auto const width = requested.value_or(config.pipeline.box.width);
        return std::min(width, output.columns() - TerminalMargin);
    }

    [[nodiscard]] auto writeLine(std::string_view text) -> VoidResult
    {
        output.writeRaw(text);
        output.writeRaw("\n");
        return output.flush();
    }

    [[nodiscard]] auto renderBubble(std::string_view raw, int outerWidth) -> VoidResult
    {
        auto const sanitized = pipeline->sanitize(raw);
        auto const layout = pipeline->render(sanitized, outerWidth);
        auto const box = pipeline->box(outerWidth);
        log::debug("Rendering {} line(s) at inner width {}", layout.lines.size(), layout.innerWidth);

        box.render(output, layout);
        return output.flush();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    log::setLevel(_impl->config.logLevel);

    if (auto result = validate(_impl->config); !result)
        return result;

    if (auto result = _impl->output.initialize(); !result)
        return result;

    auto pipelineConfig = _impl->config.pipeline;
    if (_impl->output.isTerminal())
    {
        pipelineConfig.box.borderStyle = borderStyle();
        pipelineConfig.box.titleStyle = titleStyle();
    }
    _impl->pipeline.emplace(std::move(pipelineConfig));

    log::debug("Terminal is {}x{}", _impl->output.columns(), _impl->output.rows());
    return {};
}

auto App::run(RunOptions const& options) -> int
{
    if (!_impl->pipeline)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    auto input = readInput(options.inputPath);
    if (!input)
    {
        log::error("{}", input.error());
        return 1;
    }

    auto result = VoidResult {};
    switch (options.mode)
    {
        case RunMode::Render:
            if (options.width && *options.width < 1)
            {
                log::error("Width must be positive, got {}", *options.width);
                return 1;
            }
            result = _impl->renderBubble(*input, _impl->effectiveWidth(options.width));
            break;
        case RunMode::SanitizeOnly: result = _impl->writeLine(_impl->pipeline->sanitize(*input)); break;
        case RunMode::CleanInput: result = _impl->writeLine(sanitizeInput(*input)); break;
    }

    if (!result)
    {
        log::error("{}", result.error());
        return 1;
    }
    return 0;
}

} // namespace novamind
