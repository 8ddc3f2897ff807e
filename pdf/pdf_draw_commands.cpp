#include "pdf_draw_commands.h"

#include "fontmetrics.h"

#include <cmath>

namespace sheet_pdf_internal {

namespace {
bool SameColor(const CanvasColor &a, const CanvasColor &b) {
  return std::abs(a.r - b.r) < 1e-6 && std::abs(a.g - b.g) < 1e-6 &&
         std::abs(a.b - b.b) < 1e-6;
}

void EmitColor(std::ostringstream &out, const CanvasColor &color,
               const FloatFormatter &fmt, const char *op) {
  out << fmt.Format(color.r) << ' ' << fmt.Format(color.g) << ' '
      << fmt.Format(color.b) << ' ' << op << '\n';
}
} // namespace

void GraphicsStateCache::SetStroke(std::ostringstream &out,
                                   const CanvasStroke &stroke,
                                   const FloatFormatter &fmt) {
  if (!hasStrokeColor_ || !SameColor(stroke.color, strokeColor_)) {
    EmitColor(out, stroke.color, fmt, "RG");
    strokeColor_ = stroke.color;
    hasStrokeColor_ = true;
  }
  if (!hasLineWidth_ || std::abs(stroke.width - lineWidth_) > 1e-6) {
    out << fmt.Format(stroke.width) << " w\n";
    lineWidth_ = stroke.width;
    hasLineWidth_ = true;
  }
}

void GraphicsStateCache::SetFill(std::ostringstream &out,
                                 const CanvasColor &color,
                                 const FloatFormatter &fmt) {
  if (!hasFillColor_ || !SameColor(color, fillColor_)) {
    EmitColor(out, color, fmt, "rg");
    fillColor_ = color;
    hasFillColor_ = true;
  }
}

const char *StandardFontKey(const std::string &fontFamily) {
  return IsBoldFamily(fontFamily) ? "F2" : "F1";
}

void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const Point &origin, double w,
                     double h, const CanvasStroke &stroke,
                     const CanvasFill *fill) {
  const bool stroked = stroke.width > 0.0f;
  if (!stroked && !fill)
    return;
  if (stroked)
    cache.SetStroke(out, stroke, fmt);
  if (fill)
    cache.SetFill(out, fill->color, fmt);
  out << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << ' '
      << fmt.Format(w) << ' ' << fmt.Format(h) << " re\n";
  out << (stroked && fill ? "B\n" : (fill ? "f\n" : "S\n"));
}

void AppendCircle(std::ostringstream &out, GraphicsStateCache &cache,
                  const FloatFormatter &fmt, const Point &center,
                  double radius, const CanvasStroke &stroke,
                  const CanvasFill *fill) {
  const bool stroked = stroke.width > 0.0f;
  if (!stroked && !fill)
    return;
  if (stroked)
    cache.SetStroke(out, stroke, fmt);
  if (fill)
    cache.SetFill(out, fill->color, fmt);

  // Four cubic Beziers, one per quadrant.
  const double c = radius * 0.552284749831; // 4*(sqrt(2)-1)/3
  const Point pts[13] = {{center.x + radius, center.y},
                         {center.x + radius, center.y + c},
                         {center.x + c, center.y + radius},
                         {center.x, center.y + radius},
                         {center.x - c, center.y + radius},
                         {center.x - radius, center.y + c},
                         {center.x - radius, center.y},
                         {center.x - radius, center.y - c},
                         {center.x - c, center.y - radius},
                         {center.x, center.y - radius},
                         {center.x + c, center.y - radius},
                         {center.x + radius, center.y - c},
                         {center.x + radius, center.y}};
  out << fmt.Format(pts[0].x) << ' ' << fmt.Format(pts[0].y) << " m\n";
  for (int seg = 0; seg < 4; ++seg) {
    for (int k = 1; k <= 3; ++k) {
      const Point &p = pts[seg * 3 + k];
      out << fmt.Format(p.x) << ' ' << fmt.Format(p.y) << (k < 3 ? " " : "");
    }
    out << " c\n";
  }
  out << (stroked && fill ? "b\n" : (fill ? "f\n" : "s\n"));
}

void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &pos,
                const std::string &text, const CanvasTextStyle &style) {
  const std::string encodedText = EncodeWinAnsi(text);
  const double width =
      MeasureTextWidth(text, style.fontSize, style.fontFamily);

  double x = pos.x;
  if (style.hAlign == CanvasTextStyle::HorizontalAlign::Center)
    x -= width / 2.0;

  cache.SetFill(out, style.color, fmt);
  out << "BT\n/" << StandardFontKey(style.fontFamily) << ' '
      << fmt.Format(style.fontSize) << " Tf\n"
      << fmt.Format(x) << ' ' << fmt.Format(pos.y) << " Td\n(";
  for (char ch : encodedText) {
    if (ch == '(' || ch == ')' || ch == '\\')
      out << '\\';
    if (ch == '\n' || ch == '\r') {
      out << ' ';
      continue;
    }
    out << ch;
  }
  out << ") Tj\nET\n";
}

void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const Point &origin, double w, double h,
                 const std::string &name) {
  out << "q\n"
      << fmt.Format(w) << " 0 0 " << fmt.Format(h) << ' '
      << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << " cm\n/"
      << name << " Do\nQ\n";
}

} // namespace sheet_pdf_internal
