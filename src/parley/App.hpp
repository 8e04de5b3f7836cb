// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <parley/Config.hpp>

#include <istream>
#include <memory>
#include <string>

namespace parley
{

/// @brief Wires the devices, the HTTP providers and both speech coordinators into a line-oriented console.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The application configuration.
    /// @param configPath Where /save writes the configuration.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Initializes the audio devices and the coordinators.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads commands from @p input until end of input or /quit.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace parley
