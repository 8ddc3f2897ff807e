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

#include "documentlayout.h"

#include "fieldlayouts.h"
#include "productrow.h"
#include "sheeterrors.h"

#include <sstream>
#include <string>

namespace sheet {

namespace {

// Stand-in code image for measuring rows without encoding anything.
CanvasImage MakeProbeImage() {
  CanvasImage image;
  image.key = "probe";
  image.width = 1;
  image.height = 1;
  image.samples.assign(1, 0);
  image.nominalWidth = kCodeNominalSizePt;
  image.nominalHeight = kCodeNominalSizePt;
  return image;
}

void AddMarker(CommandBuffer &buffer, double x, double y, double size) {
  MarkerCommand marker;
  marker.x = x;
  marker.y = y;
  marker.size = size;
  buffer.Add(marker);
}

constexpr double kPageEdgeTolerance = 1e-6;

// Throws ValidationError when bounds leave the page.
void RequireOnPage(const CanvasBounds &bounds, const PageGeometry &page,
                   const std::string &what) {
  if (!bounds.valid)
    return;
  if (bounds.minX >= -kPageEdgeTolerance &&
      bounds.maxX <= page.width + kPageEdgeTolerance &&
      bounds.minY >= -kPageEdgeTolerance &&
      bounds.maxY <= page.height + kPageEdgeTolerance)
    return;
  std::ostringstream msg;
  msg << what << " spans x " << bounds.minX << " to " << bounds.maxX
      << ", y " << bounds.minY << " to " << bounds.maxY
      << " and leaves the " << page.width << " x " << page.height
      << " page";
  throw ValidationError(msg.str());
}

} // namespace

CommandBuffer LayoutHeader(const ClientRecord &client,
                           const LayoutConfig &config,
                           const PageGeometry &page,
                           const ICodeEncoder &encoder) {
  CommandBuffer buffer;
  const double m = page.markerSize;
  buffer.currentSourceKey = "corner/0";
  AddMarker(buffer, 0.0, 0.0, m);
  buffer.currentSourceKey = "corner/1";
  AddMarker(buffer, 0.0, page.height - m, m);
  buffer.currentSourceKey = "corner/2";
  AddMarker(buffer, page.width - m, page.height - m, m);

  const double headerY = page.height - config.headerTopOffset;
  buffer.currentSourceKey = "client/label";
  TextCommand label;
  label.x = config.headerX;
  label.y = headerY;
  label.text = "Client: " + client.name;
  label.style.fontFamily = "Helvetica-Bold";
  label.style.fontSize = static_cast<float>(config.clientFontSize);
  buffer.Add(label);

  const CanvasImage code = encoder.Encode(client.id);
  buffer.currentSourceKey = "client/code";
  ImageCommand image;
  image.x = config.headerX;
  image.y = headerY - config.clientCodeDrop;
  image.width = code.nominalWidth * config.clientCodeScale;
  image.height = code.nominalHeight * config.clientCodeScale;
  image.imageIndex = buffer.AddImage(code);
  buffer.Add(image);

  buffer.Append(LayoutDateFields(config.dateOriginX, headerY, config), "date");
  return buffer;
}

CommandBuffer LayoutDocument(const SheetJob &job, const LayoutConfig &config,
                             const PageGeometry &page,
                             const ICodeEncoder &encoder) {
  ValidateLayoutConfig(config, page);

  CommandBuffer document = LayoutHeader(job.client, config, page, encoder);
  CanvasBounds header = ComputeSourceBounds(document, "client");
  RequireOnPage(header, page, "client section");
  const CanvasBounds dates = ComputeSourceBounds(document, "date");
  RequireOnPage(dates, page, "date fields");
  header.Extend(dates);
  if (job.products.empty())
    return document;

  const double firstBaseline = RowBaseline(0, config, page);
  CommandBuffer firstRow = LayoutProductRow(
      0, job.products.front(), encoder.Encode(job.products.front().id), config,
      page);
  RequireOnPage(ComputeBufferBounds(firstRow), page, "product row");
  const RowExtent extent = MeasureRowExtent(firstRow, firstBaseline);
  if (extent.Height() > config.rowSpacing) {
    std::ostringstream msg;
    msg << "row spacing " << config.rowSpacing
        << " is smaller than the row height " << extent.Height();
    throw ValidationError(msg.str());
  }
  if (header.valid && firstBaseline + extent.above > header.minY) {
    std::ostringstream msg;
    msg << "first product row reaches " << firstBaseline + extent.above
        << " and overlaps the header ending at " << header.minY;
    throw ValidationError(msg.str());
  }

  const size_t capacity = RowCapacity(config, page, extent.below);
  if (job.products.size() > capacity)
    throw LayoutOverflowError(job.products.size(), capacity);

  document.Append(firstRow, "row/0");
  for (size_t i = 1; i < job.products.size(); ++i) {
    const Product &product = job.products[i];
    document.Append(
        LayoutProductRow(i, product, encoder.Encode(product.id), config, page),
        "row/" + std::to_string(i));
  }
  return document;
}

size_t ComputeRowCapacity(const LayoutConfig &config,
                          const PageGeometry &page) {
  Product probe{"0", "0"};
  const CommandBuffer row =
      LayoutProductRow(0, probe, MakeProbeImage(), config, page);
  const RowExtent extent =
      MeasureRowExtent(row, RowBaseline(0, config, page));
  return RowCapacity(config, page, extent.below);
}

} // namespace sheet
