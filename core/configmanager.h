/*
 * This file is part of Tallysheet.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Tallysheet is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Tallysheet is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Tallysheet. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_map>

// Singleton holding the generator configuration. Values are kept as strings
// so the JSON file stays hand editable; numeric layout settings are
// registered as variables with a default and an allowed range.
class ConfigManager
{
public:
    // Access singleton instance
    static ConfigManager& Get();

    // Generic key-value storage
    void SetValue(const std::string& key, const std::string& value);
    std::optional<std::string> GetValue(const std::string& key) const;
    bool HasKey(const std::string& key) const;

    // Save/load the configuration as a flat JSON object
    bool LoadFromFile(const std::string& path);
    bool SaveToFile(const std::string& path) const;
    // Default user configuration path helpers
    static std::string GetUserConfigFile();
    bool LoadUserConfig();

    struct VariableInfo {
        std::string type;
        float defaultValue = 0.0f;
        float value = 0.0f;
        float minValue = 0.0f;
        float maxValue = 0.0f;
    };

    void RegisterVariable(const std::string& name, const std::string& type,
                          float defVal, float minVal, float maxVal);
    float GetFloat(const std::string& name) const;
    void SetFloat(const std::string& name, float v);
    void ApplyDefaults();

    // Restore registered defaults and drop every stored value
    void Reset();

private:
    ConfigManager();
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void RegisterLayoutVariables();

    std::unordered_map<std::string, std::string> configData;
    std::unordered_map<std::string, VariableInfo> variables;
};
