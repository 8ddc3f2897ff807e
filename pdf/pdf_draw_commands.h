#pragma once

#include "canvas2d.h"
#include "pdf_objects.h"

#include <sstream>
#include <string>

namespace sheet_pdf_internal {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Tracks the current stroke/fill state so repeated bubbles do not re-emit
// identical operators.
class GraphicsStateCache {
public:
  void SetStroke(std::ostringstream &out, const CanvasStroke &stroke,
                 const FloatFormatter &fmt);
  void SetFill(std::ostringstream &out, const CanvasColor &color,
               const FloatFormatter &fmt);

private:
  CanvasColor strokeColor_{};
  CanvasColor fillColor_{};
  double lineWidth_ = -1.0;
  bool hasStrokeColor_ = false;
  bool hasFillColor_ = false;
  bool hasLineWidth_ = false;
};

// Resource name of the standard font for a family: F2 for bold, F1 otherwise.
const char *StandardFontKey(const std::string &fontFamily);

void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const Point &origin, double w,
                     double h, const CanvasStroke &stroke,
                     const CanvasFill *fill);
void AppendCircle(std::ostringstream &out, GraphicsStateCache &cache,
                  const FloatFormatter &fmt, const Point &center,
                  double radius, const CanvasStroke &stroke,
                  const CanvasFill *fill);
// Single line of text anchored on the baseline at pos.
void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &pos,
                const std::string &text, const CanvasTextStyle &style);
void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const Point &origin, double w, double h,
                 const std::string &name);

} // namespace sheet_pdf_internal
