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

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace StringUtils {

inline std::string Trim(const std::string &s) {
  auto notSpace = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(s.begin(), s.end(), notSpace);
  if (first == s.end())
    return {};
  auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
  return std::string(first, last);
}

inline std::string ToUpperCopy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

// Splits "key<sep>value" at the last separator so names may contain it.
inline std::optional<std::pair<std::string, std::string>>
SplitLast(const std::string &s, char sep) {
  size_t pos = s.find_last_of(sep);
  if (pos == std::string::npos)
    return std::nullopt;
  return std::make_pair(s.substr(0, pos), s.substr(pos + 1));
}

} // namespace StringUtils
