#include "fontmetrics.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

// Printable ASCII 32..126.
constexpr std::array<int, 95> kHelveticaWidths = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278,
    584, 584, 584, 556, 1015, 667, 667, 722, 722, 667, 611, 778, 722, 278,
    500, 667, 556, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 278, 278, 278, 469, 556, 333, 556, 556, 500, 556, 556,
    278, 556, 556, 222, 222, 500, 222, 833, 556, 556, 556, 556, 333, 500,
    278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

constexpr std::array<int, 95> kHelveticaBoldWidths = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333,
    584, 584, 584, 611, 975, 722, 722, 722, 722, 667, 611, 778, 722, 278,
    556, 722, 611, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 333, 278, 333, 584, 556, 333, 556, 611, 556, 611, 556,
    333, 611, 611, 278, 278, 556, 278, 889, 611, 611, 611, 611, 389, 556,
    333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

int AsciiWidth(char ch, bool bold) {
  const auto &table = bold ? kHelveticaBoldWidths : kHelveticaWidths;
  return table[static_cast<unsigned char>(ch) - 32];
}

// Latin-1 letters take the width of their unaccented base letter.
char BaseLetter(unsigned char code) {
  if (code >= 0xC0 && code <= 0xC5)
    return 'A';
  if (code >= 0xC8 && code <= 0xCB)
    return 'E';
  if (code >= 0xD2 && code <= 0xD6)
    return 'O';
  if (code >= 0xD9 && code <= 0xDC)
    return 'U';
  if (code >= 0xE0 && code <= 0xE5)
    return 'a';
  if (code >= 0xE8 && code <= 0xEB)
    return 'e';
  if ((code >= 0xF2 && code <= 0xF6) || code == 0xF8)
    return 'o';
  if (code >= 0xF9 && code <= 0xFC)
    return 'u';
  switch (code) {
  case 0xC7:
    return 'C';
  case 0xCC:
  case 0xCD:
  case 0xCE:
  case 0xCF:
    return 'I';
  case 0xD1:
    return 'N';
  case 0xD8:
    return 'O';
  case 0xDD:
    return 'Y';
  case 0xE7:
    return 'c';
  case 0xF1:
    return 'n';
  case 0xFD:
  case 0xFF:
    return 'y';
  default:
    return 0;
  }
}

// Bytes in the UTF-8 sequence started by lead, 0 for an invalid lead byte.
size_t ExpectedSequenceLength(unsigned char lead) {
  if ((lead >> 5) == 0x6)
    return 2;
  if ((lead >> 4) == 0xE)
    return 3;
  if ((lead >> 3) == 0x1E)
    return 4;
  return 0;
}

bool HasContinuationBytes(const std::string &utf8, size_t start,
                          size_t length) {
  if (length == 0 || start + length > utf8.size())
    return false;
  for (size_t k = 1; k < length; ++k) {
    if ((static_cast<unsigned char>(utf8[start + k]) & 0xC0) != 0x80)
      return false;
  }
  return true;
}

} // namespace

bool IsBoldFamily(const std::string &family) {
  std::string lower = family;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.find("bold") != std::string::npos;
}

int StandardGlyphWidth(unsigned char code, bool bold) {
  if (code >= 32 && code <= 126)
    return AsciiWidth(static_cast<char>(code), bold);
  if (code >= 0xEC && code <= 0xEF)
    return 278; // accented dotless i is wider than 'i'
  if (char base = BaseLetter(code))
    return AsciiWidth(base, bold);
  return 556;
}

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F)
    return static_cast<unsigned char>(codepoint);
  if (codepoint >= 0xA0 && codepoint <= 0xFF)
    return static_cast<unsigned char>(codepoint);
  switch (codepoint) {
  case 0x20AC:
    return 0x80;
  case 0x201A:
    return 0x82;
  case 0x0192:
    return 0x83;
  case 0x201E:
    return 0x84;
  case 0x2026:
    return 0x85;
  case 0x2020:
    return 0x86;
  case 0x2021:
    return 0x87;
  case 0x02C6:
    return 0x88;
  case 0x2030:
    return 0x89;
  case 0x0160:
    return 0x8A;
  case 0x2039:
    return 0x8B;
  case 0x0152:
    return 0x8C;
  case 0x017D:
    return 0x8E;
  case 0x2018:
    return 0x91;
  case 0x2019:
    return 0x92;
  case 0x201C:
    return 0x93;
  case 0x201D:
    return 0x94;
  case 0x2022:
    return 0x95;
  case 0x2013:
    return 0x96;
  case 0x2014:
    return 0x97;
  case 0x02DC:
    return 0x98;
  case 0x2122:
    return 0x99;
  case 0x0161:
    return 0x9A;
  case 0x203A:
    return 0x9B;
  case 0x0153:
    return 0x9C;
  case 0x017E:
    return 0x9E;
  case 0x0178:
    return 0x9F;
  default:
    return '?';
  }
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char lead = static_cast<unsigned char>(utf8[i]);
    uint32_t codepoint = 0;
    size_t length = 0;
    if (lead < 0x80) {
      codepoint = lead;
      length = 1;
    } else if (!HasContinuationBytes(utf8, i, ExpectedSequenceLength(lead))) {
      out.push_back('?');
      ++i;
      continue;
    } else if ((lead >> 5) == 0x6 && i + 1 < utf8.size()) {
      codepoint = ((lead & 0x1F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 1]) & 0x3F);
      length = 2;
    } else if ((lead >> 4) == 0xE && i + 2 < utf8.size()) {
      codepoint = ((lead & 0x0F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 2]) & 0x3F);
      length = 3;
    } else if ((lead >> 3) == 0x1E && i + 3 < utf8.size()) {
      codepoint = ((lead & 0x07) << 18) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 2]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 3]) & 0x3F);
      length = 4;
    } else {
      out.push_back('?');
      ++i;
      continue;
    }
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(codepoint)));
    i += length;
  }
  return out;
}

double MeasureTextWidth(const std::string &text, double fontSize,
                        const std::string &fontFamily) {
  const bool bold = IsBoldFamily(fontFamily);
  double units = 0.0;
  for (unsigned char ch : EncodeWinAnsi(text)) {
    if (ch < 32)
      continue;
    units += StandardGlyphWidth(ch, bold);
  }
  return units / 1000.0 * fontSize;
}
