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

#include "bubblegrid.h"
#include "layoutconfig.h"

namespace sheet {

// Digit domains of the date fields. Leading columns only offer the digits a
// day (0-3) or month (0-1) can start with.
std::vector<DigitColumnSpec> DayColumns();
std::vector<DigitColumnSpec> MonthColumns();
std::vector<DigitColumnSpec> YearColumns();

BubbleStyle BubbleStyleFor(const LayoutConfig &config);

// Day, Month and Year side by side at x, x + gap and x + 2 * gap. Source keys
// are "<Field>/label" and "<Field>/<column>/<digit>".
CommandBuffer LayoutDateFields(double x, double y, const LayoutConfig &config);

// Horizontal offset from the Tens origin to the Ones origin.
double QuantityOnesOffset(const LayoutConfig &config);

// Tens and Ones rows of 0-9. Source keys are "tens/<digit>" and
// "ones/<digit>".
CommandBuffer LayoutQuantityField(double x, double y,
                                  const LayoutConfig &config);

} // namespace sheet
