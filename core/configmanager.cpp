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
#include "configmanager.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <map>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
bool TryParseFloat(const std::string &text, float &out) {
  if (text.empty())
    return false;

  // Allow leading and trailing spaces that may appear in user edited files.
  const auto first =
      std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
      });
  if (first == text.end())
    return false;
  const auto last =
      std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  const char *begin = &*first;
  const char *end = begin + std::distance(first, last);
  float value = 0.0f;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end)
    return false;
  out = value;
  return true;
}
} // namespace

ConfigManager::ConfigManager() {
  RegisterLayoutVariables();
  ApplyDefaults();
}

ConfigManager &ConfigManager::Get() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::RegisterLayoutVariables() {
  RegisterVariable("layout_bubble_radius", "float", 4.0f, 1.0f, 20.0f);
  RegisterVariable("layout_column_spacing", "float", 30.0f, 5.0f, 200.0f);
  RegisterVariable("layout_digit_spacing", "float", 12.0f, 2.0f, 100.0f);
  RegisterVariable("layout_row_spacing", "float", 30.0f, 5.0f, 400.0f);
  RegisterVariable("layout_field_gap", "float", 100.0f, 10.0f, 400.0f);
  RegisterVariable("layout_marker_size", "float", 10.0f, 2.0f, 50.0f);
  RegisterVariable("layout_quantity_spacing", "float", 15.0f, 2.0f, 100.0f);
  RegisterVariable("layout_quantity_gap", "float", 10.0f, 0.0f, 200.0f);
  RegisterVariable("layout_row_section_offset", "float", 200.0f, 50.0f,
                   800.0f);
  RegisterVariable("layout_client_code_scale", "float", 1.0f, 0.1f, 3.0f);
  RegisterVariable("layout_product_code_scale", "float", 0.3f, 0.05f, 2.0f);
}

void ConfigManager::SetValue(const std::string &key,
                             const std::string &value) {
  configData[key] = value;
}

std::optional<std::string>
ConfigManager::GetValue(const std::string &key) const {
  auto it = configData.find(key);
  if (it != configData.end())
    return it->second;
  return std::nullopt;
}

bool ConfigManager::HasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

void ConfigManager::RegisterVariable(const std::string &name,
                                     const std::string &type, float defVal,
                                     float minVal, float maxVal) {
  VariableInfo info;
  info.type = type;
  info.defaultValue = defVal;
  info.value = defVal;
  info.minValue = minVal;
  info.maxValue = maxVal;
  variables[name] = info;
}

float ConfigManager::GetFloat(const std::string &name) const {
  auto it = variables.find(name);
  float defVal = 0.0f;
  if (it != variables.end())
    defVal = it->second.defaultValue;

  auto valStr = GetValue(name);
  if (valStr) {
    float parsed = 0.0f;
    if (TryParseFloat(*valStr, parsed)) {
      if (it != variables.end())
        parsed = std::clamp(parsed, it->second.minValue, it->second.maxValue);
      return parsed;
    }
    return defVal;
  }
  return defVal;
}

void ConfigManager::SetFloat(const std::string &name, float v) {
  auto it = variables.find(name);
  if (it != variables.end()) {
    v = std::clamp(v, it->second.minValue, it->second.maxValue);
    it->second.value = v;
  }
  SetValue(name, std::to_string(v));
}

void ConfigManager::ApplyDefaults() {
  for (auto &[name, info] : variables) {
    float val = info.defaultValue;
    auto it = configData.find(name);
    if (it != configData.end()) {
      float parsed = 0.0f;
      if (TryParseFloat(it->second, parsed))
        val = parsed;
    }

    val = std::clamp(val, info.minValue, info.maxValue);
    info.value = val;
    configData[name] = std::to_string(val);
  }
  if (!HasKey("page_size"))
    configData["page_size"] = "A4";
}

void ConfigManager::Reset() {
  configData.clear();
  ApplyDefaults();
}

// -- Persistence --

bool ConfigManager::LoadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    return false;

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  if (!j.is_object())
    return false;

  std::unordered_map<std::string, std::string> loaded;
  for (auto it = j.begin(); it != j.end(); ++it) {
    // Numbers are accepted as well so the file can be written by hand.
    if (it.value().is_string())
      loaded[it.key()] = it.value().get<std::string>();
    else if (it.value().is_number())
      loaded[it.key()] = std::to_string(it.value().get<double>());
    else
      return false;
  }
  for (auto &entry : loaded)
    configData[entry.first] = std::move(entry.second);
  ApplyDefaults();
  return true;
}

bool ConfigManager::SaveToFile(const std::string &path) const {
  std::ofstream file(path);
  if (!file.is_open())
    return false;

  // std::map keeps the keys sorted so saved files diff cleanly.
  nlohmann::json j(std::map<std::string, std::string>(configData.begin(),
                                                      configData.end()));
  file << j.dump(4);
  return static_cast<bool>(file);
}

std::string ConfigManager::GetUserConfigFile() {
  wxString dir = wxStandardPaths::Get().GetUserDataDir();
  std::filesystem::path p = std::filesystem::path(dir.ToStdString());
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  p /= "user_config.json";
  return p.string();
}

bool ConfigManager::LoadUserConfig() {
  return LoadFromFile(GetUserConfigFile());
}
