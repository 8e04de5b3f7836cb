// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parley
{

/// @brief How microphone access is answered. Desktop Linux has no OS prompt for it.
enum class MicrophoneAccess : std::uint8_t
{
    Granted,
    Denied,
    Prompt, ///< Undetermined until the first recording asks for it; the request is granted.
};

[[nodiscard]] auto microphoneAccessName(MicrophoneAccess access) -> std::string_view;
[[nodiscard]] auto microphoneAccessFromString(std::string_view name) -> std::optional<MicrophoneAccess>;

/// @brief Audio configuration section.
struct AudioConfig
{
    /// @brief Case-insensitive substring of the capture device name. Empty picks the first microphone.
    std::string captureDevice;
    MicrophoneAccess microphoneAccess = MicrophoneAccess::Granted;
};

/// @brief Logging configuration section.
struct LogConfig
{
    log::Level level = log::Level::Info;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    AudioConfig audio;
    LogConfig log;

    /// @brief Flat key/value speech settings (provider selection, credentials, voices, tunables).
    nlohmann::json speech = nlohmann::json::object();
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration from JSON text.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories as needed.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/parley or ~/.config/parley
/// On macOS: ~/Library/Application Support/parley
/// On Windows: %APPDATA%\parley
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace parley
