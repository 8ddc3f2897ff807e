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

#include "fieldlayouts.h"

#include <numeric>

namespace sheet {

namespace {
std::vector<int> DigitRange(int first, int last) {
  std::vector<int> digits(static_cast<size_t>(last - first + 1));
  std::iota(digits.begin(), digits.end(), first);
  return digits;
}
} // namespace

std::vector<DigitColumnSpec> DayColumns() {
  return {{DigitRange(0, 3)}, {DigitRange(0, 9)}};
}

std::vector<DigitColumnSpec> MonthColumns() {
  return {{DigitRange(0, 1)}, {DigitRange(0, 9)}};
}

std::vector<DigitColumnSpec> YearColumns() {
  return {{DigitRange(0, 9)}, {DigitRange(0, 9)}};
}

BubbleStyle BubbleStyleFor(const LayoutConfig &config) {
  BubbleStyle style;
  style.firstRowDrop = config.bubbleDrop;
  style.lineWidth = config.bubbleLineWidth;
  style.fontSize = config.digitFontSize;
  return style;
}

CommandBuffer LayoutDateFields(double x, double y,
                               const LayoutConfig &config) {
  const BubbleStyle style = BubbleStyleFor(config);
  struct DateField {
    const char *label;
    std::vector<DigitColumnSpec> columns;
  };
  const DateField fields[] = {
      {"Day", DayColumns()}, {"Month", MonthColumns()}, {"Year", YearColumns()}};

  CommandBuffer buffer;
  double fieldX = x;
  for (const auto &field : fields) {
    buffer.Append(RenderVerticalColumns(fieldX, y, field.label, field.columns,
                                        config.bubbleRadius,
                                        config.columnSpacing,
                                        config.digitSpacing, style),
                  field.label);
    fieldX += config.fieldGap;
  }
  return buffer;
}

double QuantityOnesOffset(const LayoutConfig &config) {
  return 10.0 * config.quantitySpacing + config.quantityGap;
}

CommandBuffer LayoutQuantityField(double x, double y,
                                  const LayoutConfig &config) {
  const BubbleStyle style = BubbleStyleFor(config);
  const std::vector<int> digits = DigitRange(0, 9);

  CommandBuffer buffer;
  buffer.Append(RenderHorizontalRow(x, y, "Tens", digits, config.bubbleRadius,
                                    config.quantitySpacing, style),
                "tens");
  buffer.Append(RenderHorizontalRow(x + QuantityOnesOffset(config), y, "Ones",
                                    digits, config.bubbleRadius,
                                    config.quantitySpacing, style),
                "ones");
  return buffer;
}

} // namespace sheet
