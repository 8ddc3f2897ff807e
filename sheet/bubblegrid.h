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

#include <string>
#include <vector>

namespace sheet {

// Allowed digit values for one column of a vertical field. Rendered from the
// largest value at the top down to the smallest.
struct DigitColumnSpec {
  std::vector<int> digits;
};

enum class FieldOrientation { VerticalColumns, HorizontalRow };

// Declarative description of one bubble field. Vertical fields use columns,
// columnSpacing and rowSpacing; horizontal fields use digits and spacing.
struct BubbleFieldSpec {
  std::string label;
  FieldOrientation orientation = FieldOrientation::VerticalColumns;
  std::vector<DigitColumnSpec> columns;
  std::vector<int> digits;
  double radius = 4.0;
  double columnSpacing = 30.0;
  double rowSpacing = 12.0;
  double spacing = 15.0;
};

// Appearance shared by every bubble field.
struct BubbleStyle {
  double firstRowDrop = 15.0;
  double lineWidth = 1.0;
  double fontSize = 8.0;
  std::string fontFamily = "Helvetica-Bold";
};

// Rejects digits outside [0,9] and duplicates with ValidationError.
void ValidateDigitSet(const std::vector<int> &digits,
                      const std::string &context);

// "<label>:" at the origin, then one column of bubbles per spec left to right.
// Source keys: "label" and "<column>/<digit>" for the bubble and its digit.
CommandBuffer RenderVerticalColumns(double originX, double originY,
                                    const std::string &label,
                                    const std::vector<DigitColumnSpec> &columns,
                                    double radius, double columnSpacing,
                                    double rowSpacing,
                                    const BubbleStyle &style = {});

// One bubble per digit in the given order with the digit centred below it.
// The label is accepted but not drawn. Source keys: "<digit>".
CommandBuffer RenderHorizontalRow(double originX, double originY,
                                  const std::string &label,
                                  const std::vector<int> &digits,
                                  double radius, double spacing,
                                  const BubbleStyle &style = {});

CommandBuffer RenderBubbleField(double originX, double originY,
                                const BubbleFieldSpec &spec,
                                const BubbleStyle &style = {});

} // namespace sheet
