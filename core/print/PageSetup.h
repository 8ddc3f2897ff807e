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
#include <utility>

class ConfigManager;

namespace print {

enum class PageSize { A4 = 0, Letter = 1 };

// Portrait paper description. Sheets are always printed portrait so the
// scanner sees the corner markers in a known arrangement.
struct PageSetup {
  PageSize pageSize = PageSize::A4;

  static PageSetup LoadFromConfig(const ConfigManager &cfg);
  void SaveToConfig(ConfigManager &cfg) const;

  double PageWidthPt() const;
  double PageHeightPt() const;

private:
  std::pair<double, double> BasePageSizeMm() const;
};

std::optional<PageSize> ParsePageSize(const std::string &name);
const char *PageSizeName(PageSize size);

} // namespace print
