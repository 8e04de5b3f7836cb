// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Text.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace parley
{

auto microphoneAccessName(MicrophoneAccess access) -> std::string_view
{
    switch (access)
    {
        case MicrophoneAccess::Granted: return "granted";
        case MicrophoneAccess::Denied: return "denied";
        case MicrophoneAccess::Prompt: return "prompt";
    }
    return "granted";
}

auto microphoneAccessFromString(std::string_view name) -> std::optional<MicrophoneAccess>
{
    auto const lower = text::toLower(text::trim(name));
    if (lower == "granted")
        return MicrophoneAccess::Granted;
    if (lower == "denied")
        return MicrophoneAccess::Denied;
    if (lower == "prompt")
        return MicrophoneAccess::Prompt;
    return std::nullopt;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\parley";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/parley";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/parley";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/parley";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config file must contain a JSON object");

    auto config = AppConfig {};

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.captureDevice = json::getStringOr(audio, "captureDevice", "");

        auto const access = json::getStringOr(audio, "microphoneAccess", "granted");
        auto const parsed = microphoneAccessFromString(access);
        if (!parsed)
            return makeError(ErrorCode::ConfigError,
                             std::format("Invalid audio.microphoneAccess '{}' (expected granted, denied or prompt)",
                                         access));
        config.audio.microphoneAccess = *parsed;
    }

    // Log section
    if (root.contains("log"))
    {
        auto const levelName = json::getStringOr(root["log"], "level", "info");
        auto const level = log::levelFromString(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Invalid log.level '{}'", levelName));
        config.log.level = *level;
    }

    // Speech settings section
    if (root.contains("speech"))
    {
        if (!root["speech"].is_object())
            return makeError(ErrorCode::ConfigError, "The speech section must be a JSON object");
        config.speech = root["speech"];
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parseConfig(ss.str());
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto audio = nlohmann::json::object();
    if (!config.audio.captureDevice.empty())
        audio["captureDevice"] = config.audio.captureDevice;
    audio["microphoneAccess"] = microphoneAccessName(config.audio.microphoneAccess);
    root["audio"] = std::move(audio);

    root["log"] = nlohmann::json { { "level", log::levelName(config.log.level) } };
    root["speech"] = config.speech.is_object() ? config.speech : nlohmann::json::object();

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace parley
