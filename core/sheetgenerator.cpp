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
#include "sheetgenerator.h"

#include "configmanager.h"
#include "documentlayout.h"
#include "logger.h"
#include "regionmap.h"
#include "stagedfile.h"

#include <memory>

SheetGenerationOptions
SheetGenerationOptions::FromConfig(const ConfigManager &cfg) {
  SheetGenerationOptions options;
  options.layout = sheet::LayoutConfig::LoadFromConfig(cfg);
  options.pageSetup = print::PageSetup::LoadFromConfig(cfg);
  return options;
}

SheetExportResult GenerateDocument(const std::string &clientId,
                                   const std::string &clientName,
                                   const std::vector<Product> &products,
                                   const std::string &outputPath,
                                   const SheetGenerationOptions &options) {
  SheetJob job;
  job.client.id = clientId;
  job.client.name = clientName;
  job.products = products;
  return GenerateDocument(job, outputPath, options);
}

SheetExportResult GenerateDocument(const SheetJob &job,
                                   const std::string &outputPath,
                                   const SheetGenerationOptions &options) {
  SheetExportResult result;
  Logger &log = Logger::Instance();
  try {
    if (outputPath.empty())
      throw IoError("No output path given");

    const sheet::PageGeometry page = sheet::PageGeometry::FromPageSetup(
        options.pageSetup, options.layout.markerSize);
    QrCodeEncoder defaultEncoder;
    const ICodeEncoder &encoder =
        options.encoder ? *options.encoder : defaultEncoder;

    log.Log("Laying out sheet for client '" + job.client.name + "' with " +
            std::to_string(job.products.size()) + " products on " +
            print::PageSizeName(options.pageSetup.pageSize));
    const CommandBuffer document =
        sheet::LayoutDocument(job, options.layout, page, encoder);

    // Both outputs are staged before either replaces its target.
    StagedFile pdfFile(outputPath);
    pdfFile.Write(RenderSheetPdf(document, page, options.pdf));

    std::unique_ptr<StagedFile> regionFile;
    if (!options.regionMapPath.empty()) {
      regionFile = std::make_unique<StagedFile>(options.regionMapPath);
      regionFile->Write(
          sheet::BuildRegionMap(document, job, page, options.regionDpi) +
          "\n");
    }

    pdfFile.Commit();
    if (regionFile) {
      regionFile->Commit();
      log.Log("Wrote region map " + options.regionMapPath);
    }

    result.success = true;
    result.rowCount = job.products.size();
    result.message = "Wrote " + outputPath;
    log.Log(result.message + " (" + std::to_string(result.rowCount) +
            " rows, " + std::to_string(document.commands.size()) +
            " draw commands)");
  } catch (const SheetError &ex) {
    result.success = false;
    result.errorKind = ex.Kind();
    result.message = ex.what();
    log.Error(std::string(SheetErrorKindName(ex.Kind())) +
              " error: " + ex.what());
  } catch (const std::exception &ex) {
    result.success = false;
    result.errorKind = SheetErrorKind::None;
    result.message = std::string("Failed to generate sheet: ") + ex.what();
    log.Error(result.message);
  }
  return result;
}
