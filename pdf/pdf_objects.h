#pragma once

#include "canvas2d.h"

#include <string>

namespace sheet_pdf_internal {

struct PdfObject {
  std::string body;
};

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Wraps data in a stream object. The dictionary entries are written before
// /Length; /FlateDecode is added when the data is compressed.
PdfObject MakeStreamObject(const std::string &dictionaryEntries,
                           const std::string &data, bool compressed);

// 1-bit DeviceGray image XObject with one sample per module. Dark samples
// become 0 (black) bits; rows are padded to whole bytes.
PdfObject MakeImageObject(const CanvasImage &image, bool compress);

// Non-embedded standard Type1 font with WinAnsi encoding.
PdfObject MakeStandardFontObject(const std::string &baseFont);

} // namespace sheet_pdf_internal
