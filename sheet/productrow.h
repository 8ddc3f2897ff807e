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

#include "canvas2d.h"
#include "layoutconfig.h"
#include "sheetjob.h"

namespace sheet {

// One product row at RowBaseline(index): orientation marker, product name,
// code image and the Tens/Ones quantity field. The name is drawn exactly as
// given; a long name may run into the code. Source keys are "marker",
// "name", "code", "tens/<digit>" and "ones/<digit>".
CommandBuffer LayoutProductRow(size_t index, const Product &product,
                               const CanvasImage &code,
                               const LayoutConfig &config,
                               const PageGeometry &page);

// Vertical reach of a laid out row relative to its baseline.
struct RowExtent {
  double above = 0.0;
  double below = 0.0;

  double Height() const { return above + below; }
};

RowExtent MeasureRowExtent(const CommandBuffer &row, double baseline);

} // namespace sheet
