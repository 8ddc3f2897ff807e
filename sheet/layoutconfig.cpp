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

#include "layoutconfig.h"

#include "PageSetup.h"
#include "configmanager.h"
#include "sheeterrors.h"

#include <cmath>
#include <sstream>

namespace sheet {

namespace {
constexpr double kCapacityEpsilon = 1e-6;

void RequirePositive(double value, const char *name) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    std::ostringstream msg;
    msg << name << " must be positive (got " << value << ")";
    throw ValidationError(msg.str());
  }
}

void RequirePitch(double pitch, double radius, const char *name) {
  if (pitch < 2.0 * radius) {
    std::ostringstream msg;
    msg << name << " " << pitch << " is smaller than the bubble diameter "
        << 2.0 * radius;
    throw ValidationError(msg.str());
  }
}
} // namespace

PageGeometry PageGeometry::FromPageSetup(const print::PageSetup &setup,
                                         double markerSize) {
  PageGeometry page;
  page.width = setup.PageWidthPt();
  page.height = setup.PageHeightPt();
  page.markerSize = markerSize;
  return page;
}

LayoutConfig LayoutConfig::LoadFromConfig(const ConfigManager &cfg) {
  LayoutConfig config;
  config.bubbleRadius = cfg.GetFloat("layout_bubble_radius");
  config.columnSpacing = cfg.GetFloat("layout_column_spacing");
  config.digitSpacing = cfg.GetFloat("layout_digit_spacing");
  config.rowSpacing = cfg.GetFloat("layout_row_spacing");
  config.fieldGap = cfg.GetFloat("layout_field_gap");
  config.markerSize = cfg.GetFloat("layout_marker_size");
  config.quantitySpacing = cfg.GetFloat("layout_quantity_spacing");
  config.quantityGap = cfg.GetFloat("layout_quantity_gap");
  config.rowSectionOffset = cfg.GetFloat("layout_row_section_offset");
  config.clientCodeScale = cfg.GetFloat("layout_client_code_scale");
  config.productCodeScale = cfg.GetFloat("layout_product_code_scale");
  return config;
}

void ValidateLayoutConfig(const LayoutConfig &config,
                          const PageGeometry &page) {
  RequirePositive(page.width, "page width");
  RequirePositive(page.height, "page height");
  RequirePositive(config.bubbleRadius, "bubble radius");
  RequirePositive(config.columnSpacing, "column spacing");
  RequirePositive(config.digitSpacing, "digit spacing");
  RequirePositive(config.rowSpacing, "row spacing");
  RequirePositive(config.fieldGap, "field gap");
  RequirePositive(config.markerSize, "marker size");
  RequirePositive(config.quantitySpacing, "quantity spacing");
  RequirePositive(config.clientCodeScale, "client code scale");
  RequirePositive(config.productCodeScale, "product code scale");
  if (config.quantityGap < 0.0)
    throw ValidationError("quantity gap must not be negative");

  RequirePitch(config.columnSpacing, config.bubbleRadius, "column spacing");
  RequirePitch(config.digitSpacing, config.bubbleRadius, "digit spacing");
  RequirePitch(config.quantitySpacing, config.bubbleRadius,
               "quantity spacing");

  if (config.rowSectionOffset >= page.height - page.markerSize)
    throw ValidationError("row section starts below the bottom marker band");
}

double RowBaseline(size_t index, const LayoutConfig &config,
                   const PageGeometry &page) {
  return page.height - config.rowSectionOffset -
         static_cast<double>(index) * config.rowSpacing;
}

size_t RowCapacity(const LayoutConfig &config, const PageGeometry &page,
                   double rowDepth) {
  const double room =
      RowBaseline(0, config, page) - rowDepth - page.markerSize;
  if (room < -kCapacityEpsilon)
    return 0;
  return static_cast<size_t>(
             std::floor(room / config.rowSpacing + kCapacityEpsilon)) +
         1;
}

} // namespace sheet
