#include "fontmetrics.h"

#include <cmath>
#include <iostream>

int main() {
  const std::string input = "Euro € — test";
  const std::string encoded = EncodeWinAnsi(input);
  if (encoded.empty()) {
    std::cerr << "Encoding returned empty output" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[5]) != 0x80) {
    std::cerr << "Euro sign was not mapped to WinAnsi 0x80" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[7]) != 0x97) {
    std::cerr << "Em dash was not mapped to WinAnsi 0x97" << std::endl;
    return 1;
  }
  if (EncodeWinAnsi("Café") != std::string("Caf\xE9")) {
    std::cerr << "Latin-1 letters should keep their code" << std::endl;
    return 1;
  }
  if (EncodeWinAnsi("\xE4\xB8\xAD") != "?") {
    std::cerr << "Characters outside WinAnsi should become '?'" << std::endl;
    return 1;
  }

  // A broken sequence costs one '?' per bad byte and keeps what follows.
  if (EncodeWinAnsi("\xC3" "A") != "?A") {
    std::cerr << "Invalid continuation byte swallowed the next character"
              << std::endl;
    return 1;
  }
  if (EncodeWinAnsi("x\xE2\x82") != "x??") {
    std::cerr << "Truncated sequence should become '?' per byte" << std::endl;
    return 1;
  }

  // "Client: " in Helvetica-Bold 14 and digits in Helvetica 12.
  const double bold = MeasureTextWidth("Client: ", 14.0, "Helvetica-Bold");
  const double expectedBold = (722 + 278 + 278 + 556 + 611 + 333 + 333 + 278) /
                              1000.0 * 14.0;
  if (std::fabs(bold - expectedBold) > 1e-9) {
    std::cerr << "Bold width " << bold << " expected " << expectedBold
              << std::endl;
    return 1;
  }
  if (std::fabs(MeasureTextWidth("0123456789", 12.0, "Helvetica") -
                10 * 0.556 * 12.0) > 1e-9) {
    std::cerr << "Digits should all be 556 units wide" << std::endl;
    return 1;
  }
  if (StandardGlyphWidth(0xE9, false) != StandardGlyphWidth('e', false)) {
    std::cerr << "Accented e should measure like e" << std::endl;
    return 1;
  }
  if (!IsBoldFamily("Helvetica-Bold") || IsBoldFamily("Helvetica")) {
    std::cerr << "Bold family detection failed" << std::endl;
    return 1;
  }
  return 0;
}
