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
#pragma once

#include "canvas2d.h"

#include <string>

// Nominal printed edge of a code image before scaling: 32 mm.
constexpr double kCodeNominalSizePt = 32.0 * 72.0 / 25.4;

// Turns an opaque payload into a square monochrome image. Implementations
// throw EncodingError when the payload cannot be represented.
class ICodeEncoder {
public:
  virtual ~ICodeEncoder() = default;

  virtual CanvasImage Encode(const std::string &payload) const = 0;
};

// QR Code encoder backed by qrcodegen. Error correction level LOW (boosted
// when the payload leaves room) with a four module quiet zone.
class QrCodeEncoder : public ICodeEncoder {
public:
  explicit QrCodeEncoder(int border = 4) : border_(border) {}

  CanvasImage Encode(const std::string &payload) const override;

  int Border() const { return border_; }

private:
  int border_;
};
