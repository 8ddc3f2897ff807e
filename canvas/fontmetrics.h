#pragma once

#include <cstdint>
#include <string>

// Metrics of the two PDF standard fonts the sheet uses. Widths come from the
// Adobe core font metrics and are expressed in 1/1000 em.

// Approximates the ascent of Helvetica (718 units over 1000).
constexpr double PDF_TEXT_ASCENT_FACTOR = 0.718;
// Helvetica's 207 unit descent.
constexpr double PDF_TEXT_DESCENT_FACTOR = 0.207;

bool IsBoldFamily(const std::string &family);

// Advance width of one WinAnsi byte in 1/1000 em.
int StandardGlyphWidth(unsigned char code, bool bold);

// Converts UTF-8 to the single byte WinAnsi encoding used by the standard
// fonts. Characters without a WinAnsi slot become '?'.
std::string EncodeWinAnsi(const std::string &utf8);
unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint);

// Width of a UTF-8 string set in fontFamily at fontSize points.
double MeasureTextWidth(const std::string &text, double fontSize,
                        const std::string &fontFamily);
