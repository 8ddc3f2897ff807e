#pragma once

#include "canvas2d.h"
#include "qrcodeencoder.h"
#include "sheeterrors.h"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

// Deterministic stand-in for the QR encoder. Produces a 21x21 pattern that
// depends on the payload so identical payloads share an image.
class FakeCodeEncoder : public ICodeEncoder {
public:
  CanvasImage Encode(const std::string &payload) const override {
    ++calls;
    if (payload.empty())
      throw EncodingError("cannot encode an empty payload");
    CanvasImage image;
    image.key = "fake:" + payload;
    image.width = 21;
    image.height = 21;
    image.samples.assign(21 * 21, 0);
    unsigned seed = 0;
    for (unsigned char ch : payload)
      seed = seed * 31u + ch;
    for (size_t i = 0; i < image.samples.size(); ++i)
      image.samples[i] = ((i + seed) % 3 == 0) ? 1 : 0;
    image.nominalWidth = kCodeNominalSizePt;
    image.nominalHeight = kCodeNominalSizePt;
    return image;
  }

  mutable int calls = 0;
};

inline bool Near(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

inline bool StartsWith(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Circles whose source key starts with prefix, with their keys, in order.
inline std::vector<std::pair<std::string, CircleCommand>>
CirclesWithPrefix(const CommandBuffer &buffer, const std::string &prefix) {
  std::vector<std::pair<std::string, CircleCommand>> out;
  for (size_t i = 0; i < buffer.commands.size(); ++i) {
    if (!StartsWith(buffer.sources[i], prefix))
      continue;
    if (const auto *circle = std::get_if<CircleCommand>(&buffer.commands[i]))
      out.emplace_back(buffer.sources[i], *circle);
  }
  return out;
}

inline std::vector<TextCommand> TextsWithPrefix(const CommandBuffer &buffer,
                                                const std::string &prefix) {
  std::vector<TextCommand> out;
  for (size_t i = 0; i < buffer.commands.size(); ++i) {
    if (!StartsWith(buffer.sources[i], prefix))
      continue;
    if (const auto *text = std::get_if<TextCommand>(&buffer.commands[i]))
      out.push_back(*text);
  }
  return out;
}
