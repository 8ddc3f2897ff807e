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

#include <string>

namespace sheet {

// JSON description of where a scanner finds the client code, each date
// bubble and, per product row, the code and the Tens/Ones bubble strips.
// Boxes are given in page points (bottom-left origin) and in pixels at dpi
// (top-left origin). Built from the laid out document so the map always
// matches the rendered page.
std::string BuildRegionMap(const CommandBuffer &document, const SheetJob &job,
                           const PageGeometry &page, double dpi);

} // namespace sheet
