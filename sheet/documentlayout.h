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
#include "qrcodeencoder.h"
#include "sheetjob.h"

namespace sheet {

// Corner markers (bottom-left, top-left, top-right), client label and code,
// and the date fields. The bottom-right corner stays empty so a rotated
// sheet can be told apart. Source keys start with "corner", "client" and
// "date".
CommandBuffer LayoutHeader(const ClientRecord &client,
                           const LayoutConfig &config,
                           const PageGeometry &page,
                           const ICodeEncoder &encoder);

// Complete sheet: header followed by one row per product in input order,
// each under the source prefix "row/<index>". Validates the configuration,
// rejects a header or row that leaves the page (ValidationError), checks
// that rows neither overlap each other nor the header and throws
// LayoutOverflowError when the products do not fit on the page. Nothing is
// returned unless the whole sheet is valid.
CommandBuffer LayoutDocument(const SheetJob &job, const LayoutConfig &config,
                             const PageGeometry &page,
                             const ICodeEncoder &encoder);

// Number of product rows the page holds with this configuration.
size_t ComputeRowCapacity(const LayoutConfig &config,
                          const PageGeometry &page);

} // namespace sheet
