// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <novamind/App.hpp>
#include <novamind/Config.hpp>
#include <tui/Box.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "novamind - render language-model output as clean terminal chat bubbles" };

    auto inputPath = std::string {};
    auto configPath = std::string {};
    auto width = 0;
    auto title = std::string {};
    auto border = std::string {};
    auto sanitizeOnly = false;
    auto cleanInput = false;
    auto verbose = false;

    app.add_option("file", inputPath, "Raw model response to render (default: standard input)");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-w,--width", width, "Outer bubble width in columns")->check(CLI::PositiveNumber);
    app.add_option("--title", title, "Title shown in the top border");
    app.add_option("--border", border, "Border style (single|double|rounded|heavy)");
    auto* sanitizeFlag = app.add_flag("--sanitize-only", sanitizeOnly, "Print the sanitized text without a frame");
    app.add_flag("--clean-input", cleanInput, "Clean the input as user-typed text and print it")
        ->excludes(sanitizeFlag);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? novamind::loadConfig() : novamind::loadConfigFromFile(configPath);

    if (!configResult)
    {
        novamind::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (verbose)
        config.logLevel = novamind::log::Level::Debug;
    if (!title.empty())
        config.pipeline.box.title = title;
    if (!border.empty())
    {
        auto const style = novamind::tui::parseBorderStyle(border);
        if (!style)
        {
            novamind::log::error("Unknown border style: {}", border);
            return 1;
        }
        config.pipeline.box.border = *style;
    }

    auto options = novamind::RunOptions { .inputPath = inputPath, .mode = novamind::RunMode::Render, .width = {} };
    if (sanitizeOnly)
        options.mode = novamind::RunMode::SanitizeOnly;
    else if (cleanInput)
        options.mode = novamind::RunMode::CleanInput;
    if (width > 0)
        options.width = width;

    auto application = novamind::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        novamind::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(options);
}
