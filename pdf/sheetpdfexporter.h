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

#include <string>

struct SheetPdfOptions {
  bool compressStreams = true;
  int precision = 3; // decimals for coordinates in the content stream
};

// Replays the command buffer onto a single page PDF and returns the file
// bytes. Output depends only on the inputs; no dates or ids are embedded.
std::string RenderSheetPdf(const CommandBuffer &buffer,
                           const sheet::PageGeometry &page,
                           const SheetPdfOptions &options);
