#include "pdf_objects.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace sheet_pdf_internal {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  std::string text = ss.str();
  // "-0.000" and "0.000" must print the same for reproducible output.
  if (text.find_first_not_of("-0.") == std::string::npos)
    text = precision_ > 0 ? "0." + std::string(precision_, '0') : "0";
  return text;
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_COMPRESSION);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

PdfObject MakeStreamObject(const std::string &dictionaryEntries,
                           const std::string &data, bool compressed) {
  std::ostringstream obj;
  obj << "<< ";
  if (!dictionaryEntries.empty())
    obj << dictionaryEntries << ' ';
  obj << "/Length " << data.size();
  if (compressed)
    obj << " /Filter /FlateDecode";
  obj << " >>\nstream\n" << data << "\nendstream";
  return {obj.str()};
}

PdfObject MakeImageObject(const CanvasImage &image, bool compress) {
  const size_t rowBytes = (static_cast<size_t>(image.width) + 7) / 8;
  std::string packed(rowBytes * static_cast<size_t>(image.height), '\0');
  for (int y = 0; y < image.height; ++y) {
    for (int x = 0; x < image.width; ++x) {
      if (image.IsDark(x, y))
        continue;
      packed[static_cast<size_t>(y) * rowBytes + x / 8] |=
          static_cast<char>(0x80 >> (x % 8));
    }
  }

  std::string data = packed;
  bool compressed = false;
  if (compress) {
    std::string deflated;
    std::string error;
    if (PdfDeflater::Compress(packed, deflated, error)) {
      data.swap(deflated);
      compressed = true;
    }
  }

  std::ostringstream dict;
  dict << "/Type /XObject /Subtype /Image /Width " << image.width
       << " /Height " << image.height
       << " /ColorSpace /DeviceGray /BitsPerComponent 1 /Interpolate false";
  return MakeStreamObject(dict.str(), data, compressed);
}

PdfObject MakeStandardFontObject(const std::string &baseFont) {
  return {"<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont +
          " /Encoding /WinAnsiEncoding >>"};
}

} // namespace sheet_pdf_internal
