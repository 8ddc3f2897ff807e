#include "clientid.h"
#include "qrcodeencoder.h"
#include "sheeterrors.h"

#include <cctype>
#include <cmath>
#include <iostream>

int main() {
  const QrCodeEncoder encoder;

  // Version 1 symbol (21 modules) plus a 4 module quiet zone on each side.
  const CanvasImage image = encoder.Encode("HELLO");
  if (image.width != 29 || image.height != 29 ||
      image.samples.size() != 29u * 29u) {
    std::cerr << "Unexpected symbol size " << image.width << "\n";
    return 1;
  }
  if (std::fabs(image.nominalWidth - 32.0 * 72.0 / 25.4) > 1e-9 ||
      image.nominalWidth != image.nominalHeight) {
    std::cerr << "Code images should be 32 mm squares\n";
    return 1;
  }
  // Quiet zone is light; finder pattern corners are dark.
  if (image.IsDark(0, 0) || image.IsDark(3, 3) || !image.IsDark(4, 4) ||
      !image.IsDark(24, 4) || !image.IsDark(4, 24) || image.IsDark(11, 4)) {
    std::cerr << "Quiet zone or finder patterns misplaced\n";
    return 1;
  }
  if (image.key != "qr:HELLO" ||
      encoder.Encode("HELLO").samples != image.samples) {
    std::cerr << "Encoding should be stable per payload\n";
    return 1;
  }

  bool threw = false;
  try {
    encoder.Encode("");
  } catch (const EncodingError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Empty payload accepted\n";
    return 1;
  }

  threw = false;
  try {
    encoder.Encode(std::string(8000, 'x'));
  } catch (const EncodingError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Oversized payload accepted\n";
    return 1;
  }

  const std::string id = GenerateClientId();
  if (id.size() != 15) {
    std::cerr << "Client ids are 15 characters\n";
    return 1;
  }
  for (char ch : id) {
    if (!std::isdigit(static_cast<unsigned char>(ch)) &&
        !std::isupper(static_cast<unsigned char>(ch))) {
      std::cerr << "Client id character '" << ch << "' outside A-Z0-9\n";
      return 1;
    }
  }
  if (encoder.Encode(id).width < 21) {
    std::cerr << "Generated ids must be encodable\n";
    return 1;
  }
  return 0;
}
