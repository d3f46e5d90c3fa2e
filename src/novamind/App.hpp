// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <novamind/Config.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace novamind
{

/// @brief What a single run of the application does with its input.
enum class RunMode : std::uint8_t
{
    Render,       ///< Sanitize and print the framed bubble.
    SanitizeOnly, ///< Print the sanitized text without a frame.
    CleanInput,   ///< Treat the input as user-typed text and print it cleaned.
};

/// @brief Per-invocation options taken from the command line.
struct RunOptions
{
    std::string inputPath;    ///< File to read; empty or "-" reads standard input.
    RunMode mode = RunMode::Render;
    std::optional<int> width; ///< Outer box width; the configured width if unset.
};

/// @brief Reads the whole input file, or standard input for an empty path or "-".
[[nodiscard]] auto readInput(std::string const& path) -> Result<std::string>;

/// @brief Wires configuration, pipeline and terminal output together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration and queries the terminal.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Processes one input and writes the result to standard output.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(RunOptions const& options) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace novamind
