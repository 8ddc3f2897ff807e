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
#include "sheeterrors.h"

const char *SheetErrorKindName(SheetErrorKind kind) {
  switch (kind) {
  case SheetErrorKind::None:
    return "none";
  case SheetErrorKind::Validation:
    return "validation";
  case SheetErrorKind::Encoding:
    return "encoding";
  case SheetErrorKind::Io:
    return "io";
  case SheetErrorKind::LayoutOverflow:
    return "layout-overflow";
  }
  return "unknown";
}

int SheetErrorExitCode(SheetErrorKind kind) {
  switch (kind) {
  case SheetErrorKind::Validation:
    return kExitValidation;
  case SheetErrorKind::Encoding:
    return kExitEncoding;
  case SheetErrorKind::LayoutOverflow:
    return kExitOverflow;
  case SheetErrorKind::Io:
    return kExitIo;
  case SheetErrorKind::None:
    break;
  }
  return kExitFailure;
}
