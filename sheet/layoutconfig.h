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

#include <cstddef>

class ConfigManager;

namespace print {
struct PageSetup;
}

namespace sheet {

// Paper the sheet is laid out on. Origin bottom-left, units are points.
struct PageGeometry {
  double width = 595.276;
  double height = 841.890;
  double markerSize = 10.0;

  static PageGeometry FromPageSetup(const print::PageSetup &setup,
                                    double markerSize);
};

// Immutable layout parameters handed to every layout call. The first group
// is user configurable (layout_* keys); the remaining offsets fix where the
// header and row elements sit and are only changed by code.
struct LayoutConfig {
  double bubbleRadius = 4.0;
  double columnSpacing = 30.0;  // between date digit columns
  double digitSpacing = 12.0;   // vertical pitch inside a date column
  double rowSpacing = 30.0;     // between product row baselines
  double fieldGap = 100.0;      // between Day, Month and Year
  double markerSize = 10.0;
  double quantitySpacing = 15.0; // horizontal bubble pitch of Tens/Ones
  double quantityGap = 10.0;     // extra space between Tens and Ones
  double rowSectionOffset = 200.0; // page top to the first row baseline
  double clientCodeScale = 1.0;
  double productCodeScale = 0.3;

  double bubbleDrop = 15.0; // field origin to the first bubble row
  double bubbleLineWidth = 1.0;
  double digitFontSize = 8.0;

  double headerX = 50.0;
  double headerTopOffset = 50.0;
  double clientFontSize = 14.0;
  double clientCodeDrop = 85.0;
  double dateOriginX = 300.0;

  double rowMarkerX = 10.0;
  double rowMarkerDrop = 10.0;
  double rowNameX = 30.0;
  double rowNameDrop = 10.0;
  double rowNameFontSize = 12.0;
  double rowCodeX = 160.0;
  double rowCodeDrop = 20.0;
  double rowQuantityX = 200.0;
  double rowQuantityRise = 13.0;

  static LayoutConfig LoadFromConfig(const ConfigManager &cfg);
};

// Throws ValidationError for non-positive sizes or bubble pitches that
// would make neighbouring bubbles touch.
void ValidateLayoutConfig(const LayoutConfig &config,
                          const PageGeometry &page);

// Baseline of product row index: rowSectionStart - index * rowSpacing.
double RowBaseline(size_t index, const LayoutConfig &config,
                   const PageGeometry &page);

// Rows that fit between the first baseline and the bottom marker band when
// each row reaches rowDepth points below its baseline.
size_t RowCapacity(const LayoutConfig &config, const PageGeometry &page,
                   double rowDepth);

} // namespace sheet
