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
#include "PageSetup.h"

#include "configmanager.h"
#include "logger.h"
#include "stringutils.h"

namespace {
constexpr double kMmToPoints = 72.0 / 25.4;
} // namespace

namespace print {

std::optional<PageSize> ParsePageSize(const std::string &name) {
  const std::string upper = StringUtils::ToUpperCopy(StringUtils::Trim(name));
  if (upper == "A4")
    return PageSize::A4;
  if (upper == "LETTER")
    return PageSize::Letter;
  return std::nullopt;
}

const char *PageSizeName(PageSize size) {
  switch (size) {
  case PageSize::Letter:
    return "Letter";
  case PageSize::A4:
  default:
    return "A4";
  }
}

PageSetup PageSetup::LoadFromConfig(const ConfigManager &cfg) {
  PageSetup setup;
  if (auto value = cfg.GetValue("page_size")) {
    if (auto parsed = ParsePageSize(*value))
      setup.pageSize = *parsed;
    else
      Logger::Instance().Warn("Unknown page_size '" + *value +
                              "', using A4");
  }
  return setup;
}

void PageSetup::SaveToConfig(ConfigManager &cfg) const {
  cfg.SetValue("page_size", PageSizeName(pageSize));
}

std::pair<double, double> PageSetup::BasePageSizeMm() const {
  switch (pageSize) {
  case PageSize::Letter:
    return {215.9, 279.4};
  case PageSize::A4:
  default:
    return {210.0, 297.0};
  }
}

double PageSetup::PageWidthPt() const {
  return BasePageSizeMm().first * kMmToPoints;
}

double PageSetup::PageHeightPt() const {
  return BasePageSizeMm().second * kMmToPoints;
}

} // namespace print
