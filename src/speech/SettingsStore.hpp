// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley
{

/// @brief Read-only key/value access to persisted speech settings.
///
/// Accessors return std::nullopt for missing keys and for values of an incompatible type. Blank strings
/// are returned as-is; interpreting them as "unset" is the caller's business.
class SettingsStore
{
  public:
    virtual ~SettingsStore() = default;

    [[nodiscard]] virtual auto string(std::string_view key) const -> std::optional<std::string> = 0;
    [[nodiscard]] virtual auto number(std::string_view key) const -> std::optional<double> = 0;
    [[nodiscard]] virtual auto integer(std::string_view key) const -> std::optional<int> = 0;
    [[nodiscard]] virtual auto boolean(std::string_view key) const -> std::optional<bool> = 0;

    /// @brief Reads a list of strings stored either as a JSON array or as a JSON-encoded array string.
    [[nodiscard]] virtual auto stringList(std::string_view key) const -> std::vector<std::string> = 0;
};

/// @brief SettingsStore over a flat JSON object, as found in the "speech" section of the config file.
///
/// Numbers and booleans may also be stored as strings ("1.25", "true"); such strings are parsed, and
/// unparsable or blank ones read as missing.
class JsonSettingsStore final: public SettingsStore
{
  public:
    JsonSettingsStore() = default;
    explicit JsonSettingsStore(nlohmann::json values);

    [[nodiscard]] auto string(std::string_view key) const -> std::optional<std::string> override;
    [[nodiscard]] auto number(std::string_view key) const -> std::optional<double> override;
    [[nodiscard]] auto integer(std::string_view key) const -> std::optional<int> override;
    [[nodiscard]] auto boolean(std::string_view key) const -> std::optional<bool> override;
    [[nodiscard]] auto stringList(std::string_view key) const -> std::vector<std::string> override;

    /// @brief Sets or replaces a value.
    void set(std::string_view key, nlohmann::json value);

    [[nodiscard]] auto values() const -> const nlohmann::json& { return _values; }

  private:
    [[nodiscard]] auto find(std::string_view key) const -> const nlohmann::json*;

    nlohmann::json _values = nlohmann::json::object();
};

} // namespace parley
