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

#include "productrow.h"

#include "fieldlayouts.h"

namespace sheet {

CommandBuffer LayoutProductRow(size_t index, const Product &product,
                               const CanvasImage &code,
                               const LayoutConfig &config,
                               const PageGeometry &page) {
  const double rowY = RowBaseline(index, config, page);
  CommandBuffer buffer;

  buffer.currentSourceKey = "marker";
  MarkerCommand marker;
  marker.x = config.rowMarkerX;
  marker.y = rowY - config.rowMarkerDrop;
  marker.size = config.markerSize;
  buffer.Add(marker);

  buffer.currentSourceKey = "name";
  TextCommand name;
  name.x = config.rowNameX;
  name.y = rowY - config.rowNameDrop;
  name.text = product.name;
  name.style.fontFamily = "Helvetica";
  name.style.fontSize = static_cast<float>(config.rowNameFontSize);
  buffer.Add(name);

  buffer.currentSourceKey = "code";
  ImageCommand image;
  image.x = config.rowCodeX;
  image.y = rowY - config.rowCodeDrop;
  image.width = code.nominalWidth * config.productCodeScale;
  image.height = code.nominalHeight * config.productCodeScale;
  image.imageIndex = buffer.AddImage(code);
  buffer.Add(image);

  buffer.Append(LayoutQuantityField(config.rowQuantityX,
                                    rowY + config.rowQuantityRise, config));
  return buffer;
}

RowExtent MeasureRowExtent(const CommandBuffer &row, double baseline) {
  RowExtent extent;
  const CanvasBounds bounds = ComputeBufferBounds(row);
  if (!bounds.valid)
    return extent;
  extent.above = bounds.maxY - baseline;
  extent.below = baseline - bounds.minY;
  return extent;
}

} // namespace sheet
