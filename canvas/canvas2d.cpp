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

#include "canvas2d.h"

#include "fontmetrics.h"

#include <algorithm>
#include <type_traits>

size_t CommandBuffer::AddImage(const CanvasImage &image) {
  if (!image.key.empty()) {
    for (size_t i = 0; i < images.size(); ++i) {
      if (images[i].key == image.key)
        return i;
    }
  }
  images.push_back(image);
  return images.size() - 1;
}

void CommandBuffer::Append(const CommandBuffer &other,
                           const std::string &sourcePrefix) {
  std::vector<size_t> remap;
  remap.reserve(other.images.size());
  for (const auto &image : other.images)
    remap.push_back(AddImage(image));

  for (size_t i = 0; i < other.commands.size(); ++i) {
    CanvasCommand cmd = other.commands[i];
    if (auto *image = std::get_if<ImageCommand>(&cmd))
      image->imageIndex = remap.at(image->imageIndex);
    commands.push_back(std::move(cmd));
    std::string key =
        i < other.sources.size() ? other.sources[i] : std::string("unknown");
    if (!sourcePrefix.empty())
      key = key.empty() ? sourcePrefix : sourcePrefix + "/" + key;
    sources.push_back(std::move(key));
  }
}

void CanvasBounds::Extend(double x, double y) {
  if (!valid) {
    minX = maxX = x;
    minY = maxY = y;
    valid = true;
    return;
  }
  minX = std::min(minX, x);
  minY = std::min(minY, y);
  maxX = std::max(maxX, x);
  maxY = std::max(maxY, y);
}

void CanvasBounds::Extend(const CanvasBounds &other) {
  if (!other.valid)
    return;
  Extend(other.minX, other.minY);
  Extend(other.maxX, other.maxY);
}

bool CanvasBounds::Overlaps(const CanvasBounds &other) const {
  if (!valid || !other.valid)
    return false;
  return minX < other.maxX && other.minX < maxX && minY < other.maxY &&
         other.minY < maxY;
}

CanvasBounds ComputeCommandBounds(const CanvasCommand &command) {
  CanvasBounds bounds;
  std::visit(
      [&](auto &&c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, MarkerCommand>) {
          bounds.Extend(c.x, c.y);
          bounds.Extend(c.x + c.size, c.y + c.size);
        } else if constexpr (std::is_same_v<T, CircleCommand>) {
          const double r = c.radius + c.stroke.width * 0.5;
          bounds.Extend(c.cx - r, c.cy - r);
          bounds.Extend(c.cx + r, c.cy + r);
        } else if constexpr (std::is_same_v<T, TextCommand>) {
          const double width =
              MeasureTextWidth(c.text, c.style.fontSize, c.style.fontFamily);
          double left = c.x;
          if (c.style.hAlign == CanvasTextStyle::HorizontalAlign::Center)
            left -= width / 2.0;
          bounds.Extend(left, c.y - c.style.fontSize * PDF_TEXT_DESCENT_FACTOR);
          bounds.Extend(left + width,
                        c.y + c.style.fontSize * PDF_TEXT_ASCENT_FACTOR);
        } else if constexpr (std::is_same_v<T, ImageCommand>) {
          bounds.Extend(c.x, c.y);
          bounds.Extend(c.x + c.width, c.y + c.height);
        }
      },
      command);
  return bounds;
}

CanvasBounds ComputeBufferBounds(const CommandBuffer &buffer) {
  CanvasBounds bounds;
  for (const auto &cmd : buffer.commands)
    bounds.Extend(ComputeCommandBounds(cmd));
  return bounds;
}

CanvasBounds ComputeSourceBounds(const CommandBuffer &buffer,
                                 const std::string &prefix) {
  CanvasBounds bounds;
  for (size_t i = 0; i < buffer.commands.size(); ++i) {
    if (i >= buffer.sources.size() ||
        buffer.sources[i].compare(0, prefix.size(), prefix) != 0)
      continue;
    bounds.Extend(ComputeCommandBounds(buffer.commands[i]));
  }
  return bounds;
}

void ReplayCommandBuffer(const CommandBuffer &buffer, ICanvas2D &canvas) {
  for (size_t i = 0; i < buffer.commands.size(); ++i) {
    if (i < buffer.sources.size())
      canvas.SetSourceKey(buffer.sources[i]);
    const auto &cmd = buffer.commands[i];
    if (const auto *marker = std::get_if<MarkerCommand>(&cmd)) {
      CanvasStroke noStroke;
      noStroke.width = 0.0f;
      canvas.DrawRectangle(marker->x, marker->y, marker->size, marker->size,
                           noStroke, &marker->fill);
    } else if (const auto *circle = std::get_if<CircleCommand>(&cmd)) {
      canvas.DrawCircle(circle->cx, circle->cy, circle->radius, circle->stroke,
                        circle->hasFill ? &circle->fill : nullptr);
    } else if (const auto *text = std::get_if<TextCommand>(&cmd)) {
      canvas.DrawText(text->x, text->y, text->text, text->style);
    } else if (const auto *image = std::get_if<ImageCommand>(&cmd)) {
      canvas.DrawImage(image->x, image->y, image->width, image->height,
                       buffer.images.at(image->imageIndex));
    }
  }
}
