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

#include "sheetpdfexporter.h"

#include "logger.h"
#include "pdf_objects.h"
#include "pdf_writer.h"
#include "pdfcanvas.h"

#include <sstream>
#include <vector>

using namespace sheet_pdf_internal;

namespace {

struct PdfDocumentObjects {
  std::vector<PdfObject> objects;
  size_t catalogIndex = 0;
};

PdfDocumentObjects BuildDocumentObjects(const CommandBuffer &buffer,
                                        const sheet::PageGeometry &page,
                                        const SheetPdfOptions &options) {
  PdfCanvas canvas(options.precision);
  canvas.BeginFrame(page.width, page.height);
  ReplayCommandBuffer(buffer, canvas);
  canvas.EndFrame();

  const FloatFormatter &formatter = canvas.Formatter();
  PdfDocumentObjects doc;
  auto &objects = doc.objects;
  objects.push_back(MakeStandardFontObject("Helvetica"));
  objects.push_back(MakeStandardFontObject("Helvetica-Bold"));

  std::ostringstream xobjects;
  for (const auto &resource : canvas.Images()) {
    objects.push_back(MakeImageObject(resource.image, options.compressStreams));
    xobjects << '/' << resource.name << ' ' << objects.size() << " 0 R ";
  }

  const std::string content = canvas.Content();
  std::string compressedContent;
  bool useCompression = false;
  if (options.compressStreams) {
    std::string error;
    if (PdfDeflater::Compress(content, compressedContent, error))
      useCompression = true;
    else
      Logger::Instance().Warn("Writing uncompressed content stream: " + error);
  }
  objects.push_back(MakeStreamObject(
      {}, useCompression ? compressedContent : content, useCompression));
  const size_t contentIndex = objects.size();
  const size_t pageIndex = contentIndex + 1;
  const size_t pagesIndex = pageIndex + 1;
  const size_t catalogIndex = pagesIndex + 1;

  std::ostringstream resources;
  resources << "<< /Font << /F1 1 0 R /F2 2 0 R >>";
  if (!canvas.Images().empty())
    resources << " /XObject << " << xobjects.str() << ">>";
  resources << " >>";

  std::ostringstream pageObj;
  pageObj << "<< /Type /Page /Parent " << pagesIndex << " 0 R /MediaBox [0 0 "
          << formatter.Format(page.width) << ' '
          << formatter.Format(page.height) << "] /Contents " << contentIndex
          << " 0 R /Resources " << resources.str() << " >>";
  objects.push_back({pageObj.str()});
  objects.push_back({"<< /Type /Pages /Kids [" + std::to_string(pageIndex) +
                     " 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Catalog /Pages " + std::to_string(pagesIndex) +
                     " 0 R >>"});
  doc.catalogIndex = catalogIndex;
  return doc;
}

} // namespace

std::string RenderSheetPdf(const CommandBuffer &buffer,
                           const sheet::PageGeometry &page,
                           const SheetPdfOptions &options) {
  const PdfDocumentObjects doc = BuildDocumentObjects(buffer, page, options);
  return SerializePdfDocument(doc.objects, doc.catalogIndex);
}
