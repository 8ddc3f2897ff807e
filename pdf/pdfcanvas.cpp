#include "pdfcanvas.h"

#include "logger.h"

#include <cstdlib>

namespace {
bool ShouldTraceLayout() {
  static const bool enabled =
      std::getenv("TALLYSHEET_TRACE_LAYOUT") != nullptr;
  return enabled;
}
} // namespace

using sheet_pdf_internal::Point;

PdfCanvas::PdfCanvas(int precision) : formatter_(precision) {}

void PdfCanvas::BeginFrame(double pageWidth, double pageHeight) {
  pageWidth_ = pageWidth;
  pageHeight_ = pageHeight;
  content_.str(std::string());
  content_.clear();
  images_.clear();
  cache_ = sheet_pdf_internal::GraphicsStateCache();
  sourceKey_.clear();
  finished_ = false;
}

void PdfCanvas::EndFrame() { finished_ = true; }

void PdfCanvas::SetSourceKey(const std::string &key) { sourceKey_ = key; }

void PdfCanvas::DrawRectangle(double x, double y, double w, double h,
                              const CanvasStroke &stroke,
                              const CanvasFill *fill) {
  Trace("rect " + formatter_.Format(x) + "," + formatter_.Format(y));
  sheet_pdf_internal::AppendRectangle(content_, cache_, formatter_, Point{x, y},
                                      w, h, stroke, fill);
}

void PdfCanvas::DrawCircle(double cx, double cy, double radius,
                           const CanvasStroke &stroke,
                           const CanvasFill *fill) {
  Trace("circle " + formatter_.Format(cx) + "," + formatter_.Format(cy));
  sheet_pdf_internal::AppendCircle(content_, cache_, formatter_,
                                   Point{cx, cy}, radius, stroke, fill);
}

void PdfCanvas::DrawText(double x, double y, const std::string &text,
                         const CanvasTextStyle &style) {
  Trace("text '" + text + "' " + formatter_.Format(x) + "," +
        formatter_.Format(y));
  sheet_pdf_internal::AppendText(content_, cache_, formatter_, Point{x, y},
                                 text, style);
}

void PdfCanvas::DrawImage(double x, double y, double w, double h,
                          const CanvasImage &image) {
  const std::string &name = ImageName(image);
  Trace("image /" + name + " " + formatter_.Format(x) + "," +
        formatter_.Format(y));
  sheet_pdf_internal::AppendImage(content_, formatter_, Point{x, y}, w, h,
                                  name);
}

const std::string &PdfCanvas::ImageName(const CanvasImage &image) {
  if (!image.key.empty()) {
    for (const auto &resource : images_) {
      if (resource.image.key == image.key)
        return resource.name;
    }
  }
  images_.push_back({"Im" + std::to_string(images_.size() + 1), image});
  return images_.back().name;
}

void PdfCanvas::Trace(const std::string &what) const {
  if (!ShouldTraceLayout())
    return;
  Logger::Instance().Log("[layout] " + sourceKey_ + ": " + what);
}
