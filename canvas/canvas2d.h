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

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Simple RGBA color container expressed in floating point values.
struct CanvasColor {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;
};

// Basic line style description shared by commands that involve strokes.
struct CanvasStroke {
  CanvasColor color{};
  float width = 1.0f; // Expressed in page points
};

// Fill style used by markers and circles.
struct CanvasFill {
  CanvasColor color{};
};

// Describes text appearance. The coordinate passed to text commands is the
// baseline anchor; horizontal alignment moves the text around that anchor.
// Only the PDF standard fonts are used ("Helvetica", "Helvetica-Bold").
struct CanvasTextStyle {
  std::string fontFamily = "Helvetica";
  float fontSize = 12.0f;
  CanvasColor color{};
  enum class HorizontalAlign { Left, Center } hAlign =
      HorizontalAlign::Left;
};

// Monochrome raster drawn by image commands (QR codes). Samples are stored
// row-major from the top row down, one byte per sample, non-zero meaning
// dark. nominalWidth/nominalHeight give the unscaled size in page points.
struct CanvasImage {
  std::string key;
  int width = 0;
  int height = 0;
  std::vector<uint8_t> samples;
  double nominalWidth = 0.0;
  double nominalHeight = 0.0;

  bool IsDark(int x, int y) const {
    return samples[static_cast<size_t>(y) * width + x] != 0;
  }
};

// Abstract interface representing a page drawing surface. Coordinates are
// page points with the origin at the bottom-left corner and y pointing up.
class ICanvas2D {
public:
  virtual ~ICanvas2D() = default;

  virtual void BeginFrame(double pageWidth, double pageHeight) = 0;
  virtual void EndFrame() = 0;

  virtual void SetSourceKey(const std::string &key) = 0;

  virtual void DrawRectangle(double x, double y, double w, double h,
                             const CanvasStroke &stroke,
                             const CanvasFill *fill) = 0;
  virtual void DrawCircle(double cx, double cy, double radius,
                          const CanvasStroke &stroke,
                          const CanvasFill *fill) = 0;
  virtual void DrawText(double x, double y, const std::string &text,
                        const CanvasTextStyle &style) = 0;
  // Draws the image scaled to w x h with its lower-left corner at (x, y).
  virtual void DrawImage(double x, double y, double w, double h,
                         const CanvasImage &image) = 0;
};

// Command types produced by the layout code. Each command stores all data
// needed to reproduce the drawing; the buffer order is the paint order.

// Filled square used for orientation markers. (x, y) is the lower-left corner.
struct MarkerCommand {
  double x = 0.0;
  double y = 0.0;
  double size = 0.0;
  CanvasFill fill{};
};

struct CircleCommand {
  double cx = 0.0;
  double cy = 0.0;
  double radius = 0.0;
  CanvasStroke stroke{};
  CanvasFill fill{};
  bool hasFill = false;
};

struct TextCommand {
  double x = 0.0;
  double y = 0.0;
  std::string text;
  CanvasTextStyle style{};
};

// Places CommandBuffer::images[imageIndex] with its lower-left corner at
// (x, y). width/height are the drawn size after scaling.
struct ImageCommand {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  size_t imageIndex = 0;
};

using CanvasCommand =
    std::variant<MarkerCommand, CircleCommand, TextCommand, ImageCommand>;

// Container preserving the order of issued drawing commands together with a
// source key per command ("corner", "date/Day", "row/3/tens", ...) and the
// images referenced by ImageCommands.
struct CommandBuffer {
  std::vector<CanvasCommand> commands;
  std::vector<std::string> sources;
  std::vector<CanvasImage> images;

  std::string currentSourceKey = "unknown";

  void Add(CanvasCommand command) {
    commands.push_back(std::move(command));
    sources.push_back(currentSourceKey);
  }

  // Stores the image, reusing an existing entry with the same key.
  size_t AddImage(const CanvasImage &image);

  // Appends another buffer, remapping its image indices into this one. A
  // non-empty sourcePrefix is joined in front of the appended source keys
  // ("Day/0/3" under "date" becomes "date/Day/0/3"); an empty key takes the
  // prefix itself.
  void Append(const CommandBuffer &other,
              const std::string &sourcePrefix = {});
};

// Axis aligned box in page points.
struct CanvasBounds {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;
  bool valid = false;

  void Extend(double x, double y);
  void Extend(const CanvasBounds &other);
  double Width() const { return valid ? maxX - minX : 0.0; }
  double Height() const { return valid ? maxY - minY : 0.0; }
  bool Overlaps(const CanvasBounds &other) const;
};

// Box covered by a single command. Text boxes use the standard font metrics
// from fontmetrics.h; stroke widths are included.
CanvasBounds ComputeCommandBounds(const CanvasCommand &command);
CanvasBounds ComputeBufferBounds(const CommandBuffer &buffer);
// Bounds of every command whose source key starts with prefix.
CanvasBounds ComputeSourceBounds(const CommandBuffer &buffer,
                                 const std::string &prefix);

// Issues every command of the buffer to the canvas in order.
void ReplayCommandBuffer(const CommandBuffer &buffer, ICanvas2D &canvas);
