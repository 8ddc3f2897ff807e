#pragma once

#include "canvas2d.h"
#include "pdf_draw_commands.h"

#include <sstream>
#include <string>
#include <vector>

// ICanvas2D implementation that records PDF content stream operators.
// Images are collected as named resources (/Im1, /Im2, ...) in first use
// order; images sharing a key share one resource.
class PdfCanvas : public ICanvas2D {
public:
  struct ImageResource {
    std::string name;
    CanvasImage image;
  };

  explicit PdfCanvas(int precision = 3);

  void BeginFrame(double pageWidth, double pageHeight) override;
  void EndFrame() override;

  void SetSourceKey(const std::string &key) override;

  void DrawRectangle(double x, double y, double w, double h,
                     const CanvasStroke &stroke,
                     const CanvasFill *fill) override;
  void DrawCircle(double cx, double cy, double radius,
                  const CanvasStroke &stroke,
                  const CanvasFill *fill) override;
  void DrawText(double x, double y, const std::string &text,
                const CanvasTextStyle &style) override;
  void DrawImage(double x, double y, double w, double h,
                 const CanvasImage &image) override;

  std::string Content() const { return content_.str(); }
  const std::vector<ImageResource> &Images() const { return images_; }
  double PageWidth() const { return pageWidth_; }
  double PageHeight() const { return pageHeight_; }
  bool Finished() const { return finished_; }
  const sheet_pdf_internal::FloatFormatter &Formatter() const {
    return formatter_;
  }

private:
  const std::string &ImageName(const CanvasImage &image);
  void Trace(const std::string &what) const;

  sheet_pdf_internal::FloatFormatter formatter_;
  sheet_pdf_internal::GraphicsStateCache cache_;
  std::ostringstream content_;
  std::vector<ImageResource> images_;
  std::string sourceKey_;
  double pageWidth_ = 0.0;
  double pageHeight_ = 0.0;
  bool finished_ = false;
};
