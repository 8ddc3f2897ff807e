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

#include "bubblegrid.h"

#include "sheeterrors.h"

#include <algorithm>
#include <array>
#include <functional>

namespace sheet {

namespace {

void RequireGeometry(double radius, double spacing, const char *what) {
  if (!(radius > 0.0))
    throw ValidationError("bubble radius must be positive");
  if (!(spacing > 0.0))
    throw ValidationError(std::string(what) + " must be positive");
}

CircleCommand MakeBubble(double cx, double cy, double radius,
                         const BubbleStyle &style) {
  CircleCommand circle;
  circle.cx = cx;
  circle.cy = cy;
  circle.radius = radius;
  circle.stroke.width = static_cast<float>(style.lineWidth);
  circle.hasFill = false;
  return circle;
}

TextCommand MakeDigitText(double x, double y, int digit,
                          const BubbleStyle &style,
                          CanvasTextStyle::HorizontalAlign align) {
  TextCommand text;
  text.x = x;
  text.y = y;
  text.text = std::to_string(digit);
  text.style.fontFamily = style.fontFamily;
  text.style.fontSize = static_cast<float>(style.fontSize);
  text.style.hAlign = align;
  return text;
}

} // namespace

void ValidateDigitSet(const std::vector<int> &digits,
                      const std::string &context) {
  std::array<bool, 10> seen{};
  for (int d : digits) {
    if (d < 0 || d > 9)
      throw ValidationError(context + ": digit " + std::to_string(d) +
                            " is outside 0-9");
    if (seen[d])
      throw ValidationError(context + ": digit " + std::to_string(d) +
                            " appears twice");
    seen[d] = true;
  }
}

CommandBuffer RenderVerticalColumns(double originX, double originY,
                                    const std::string &label,
                                    const std::vector<DigitColumnSpec> &columns,
                                    double radius, double columnSpacing,
                                    double rowSpacing,
                                    const BubbleStyle &style) {
  RequireGeometry(radius, columnSpacing, "column spacing");
  if (!(rowSpacing > 0.0))
    throw ValidationError("digit row spacing must be positive");
  for (size_t i = 0; i < columns.size(); ++i)
    ValidateDigitSet(columns[i].digits,
                     label + " column " + std::to_string(i));

  CommandBuffer buffer;
  buffer.currentSourceKey = "label";
  TextCommand title;
  title.x = originX;
  title.y = originY;
  title.text = label + ":";
  title.style.fontFamily = style.fontFamily;
  title.style.fontSize = static_cast<float>(style.fontSize);
  buffer.Add(title);

  for (size_t col = 0; col < columns.size(); ++col) {
    std::vector<int> sorted = columns[col].digits;
    std::sort(sorted.begin(), sorted.end(), std::greater<int>());
    const double bx = originX + static_cast<double>(col) * columnSpacing;
    for (size_t row = 0; row < sorted.size(); ++row) {
      const double by = originY - style.firstRowDrop -
                        static_cast<double>(row) * rowSpacing;
      buffer.currentSourceKey =
          std::to_string(col) + "/" + std::to_string(sorted[row]);
      buffer.Add(MakeBubble(bx, by, radius, style));
      buffer.Add(MakeDigitText(bx + radius + 2.0, by - radius / 2.0,
                               sorted[row], style,
                               CanvasTextStyle::HorizontalAlign::Left));
    }
  }
  return buffer;
}

CommandBuffer RenderHorizontalRow(double originX, double originY,
                                  const std::string &label,
                                  const std::vector<int> &digits,
                                  double radius, double spacing,
                                  const BubbleStyle &style) {
  RequireGeometry(radius, spacing, "bubble spacing");
  ValidateDigitSet(digits, label.empty() ? std::string("row") : label);

  CommandBuffer buffer;
  const double by = originY - style.firstRowDrop;
  for (size_t i = 0; i < digits.size(); ++i) {
    const double bx = originX + static_cast<double>(i) * spacing;
    buffer.currentSourceKey = std::to_string(digits[i]);
    buffer.Add(MakeBubble(bx, by, radius, style));
    buffer.Add(MakeDigitText(bx, by - radius - 8.0, digits[i], style,
                             CanvasTextStyle::HorizontalAlign::Center));
  }
  return buffer;
}

CommandBuffer RenderBubbleField(double originX, double originY,
                                const BubbleFieldSpec &spec,
                                const BubbleStyle &style) {
  if (spec.orientation == FieldOrientation::HorizontalRow)
    return RenderHorizontalRow(originX, originY, spec.label, spec.digits,
                               spec.radius, spec.spacing, style);
  return RenderVerticalColumns(originX, originY, spec.label, spec.columns,
                               spec.radius, spec.columnSpacing,
                               spec.rowSpacing, style);
}

} // namespace sheet
