// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <parley/App.hpp>
#include <parley/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "parley - speak chat messages aloud and dictate replies via cloud speech APIs" };

    auto configPath = std::string {};
    auto logLevel = std::string {};
    auto captureDevice = std::string {};
    auto settings = std::vector<std::string> {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_option("--capture-device", captureDevice, "Capture device name (substring match)");
    app.add_option("--settings", settings, "Override a speech setting (KEY=VALUE, repeatable)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? parley::loadConfig() : parley::loadConfigFromFile(configPath);
    if (!configResult)
    {
        parley::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!logLevel.empty())
    {
        auto const level = parley::log::levelFromString(logLevel);
        if (!level)
        {
            parley::log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        config.log.level = *level;
    }
    if (verbose)
        config.log.level = parley::log::Level::Debug;
    parley::log::setLevel(config.log.level);

    if (!captureDevice.empty())
        config.audio.captureDevice = captureDevice;

    for (auto const& assignment: settings)
    {
        auto const eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            parley::log::error("Invalid --settings value '{}' (expected KEY=VALUE)", assignment);
            return 1;
        }
        config.speech[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }

    // Writing to the stdin of a curl process that already exited must fail with EPIPE instead.
    std::signal(SIGPIPE, SIG_IGN);

    auto const savePath = configPath.empty() ? parley::defaultConfigPath() : configPath;
    auto application = parley::App(std::move(config), savePath);
    auto initResult = application.initialize();
    if (!initResult)
    {
        parley::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(std::cin);
}
