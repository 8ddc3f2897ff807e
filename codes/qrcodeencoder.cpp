/*
 * This file is part of Tallysheet.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Tallysheet is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Tallysheet is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Tallysheet. If not, see <https://www.gnu.org/licenses/>.
 */

#include "qrcodeencoder.h"

#include "sheeterrors.h"

#include <qrcodegen.hpp>

#include <stdexcept>

CanvasImage QrCodeEncoder::Encode(const std::string &payload) const {
  if (payload.empty())
    throw EncodingError("cannot encode an empty payload");
  if (payload.find('\0') != std::string::npos)
    throw EncodingError("payload contains a NUL character");

  qrcodegen::QrCode qr = [&]() {
    try {
      return qrcodegen::QrCode::encodeText(payload.c_str(),
                                           qrcodegen::QrCode::Ecc::LOW);
    } catch (const std::length_error &ex) {
      throw EncodingError("payload of " + std::to_string(payload.size()) +
                          " bytes is too long for a QR code: " + ex.what());
    }
  }();

  const int modules = qr.getSize();
  CanvasImage image;
  image.key = "qr:" + payload;
  image.width = modules + 2 * border_;
  image.height = image.width;
  image.samples.assign(static_cast<size_t>(image.width) * image.height, 0);
  for (int y = 0; y < modules; ++y) {
    for (int x = 0; x < modules; ++x) {
      if (qr.getModule(x, y))
        image.samples[static_cast<size_t>(y + border_) * image.width + x +
                      border_] = 1;
    }
  }
  image.nominalWidth = kCodeNominalSizePt;
  image.nominalHeight = kCodeNominalSizePt;
  return image;
}
