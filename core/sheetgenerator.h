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

#include "PageSetup.h"
#include "layoutconfig.h"
#include "qrcodeencoder.h"
#include "sheeterrors.h"
#include "sheetjob.h"
#include "sheetpdfexporter.h"

#include <string>
#include <vector>

class ConfigManager;

struct SheetGenerationOptions {
  sheet::LayoutConfig layout;
  print::PageSetup pageSetup;
  SheetPdfOptions pdf;
  // Optional JSON sidecar with scanner regions; empty disables it.
  std::string regionMapPath;
  double regionDpi = 150.0;
  // Code encoder; a QrCodeEncoder is used when null.
  const ICodeEncoder *encoder = nullptr;

  static SheetGenerationOptions FromConfig(const ConfigManager &cfg);
};

struct SheetExportResult {
  bool success = false;
  SheetErrorKind errorKind = SheetErrorKind::None;
  std::string message;
  size_t rowCount = 0;
};

// Lays out and writes one audit sheet and, when requested, its region map.
// On failure no existing file at either path is replaced; the result carries
// the failure category.
SheetExportResult GenerateDocument(const std::string &clientId,
                                   const std::string &clientName,
                                   const std::vector<Product> &products,
                                   const std::string &outputPath,
                                   const SheetGenerationOptions &options = {});
SheetExportResult GenerateDocument(const SheetJob &job,
                                   const std::string &outputPath,
                                   const SheetGenerationOptions &options = {});
