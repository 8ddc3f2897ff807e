#include "documentlayout.h"
#include "sheet_test_support.h"
#include "sheetgenerator.h"
#include "sheetpdfexporter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace sheet;

namespace {
std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}
} // namespace

int main() {
  const LayoutConfig config;
  const PageGeometry page;
  FakeCodeEncoder encoder;

  SheetJob job;
  job.client = {"7F3A9C", "Rodoltte"};
  job.products = {{"Rol de Canela", "Rol de Canela"}, {"Café (grano)", "C-2"}};

  // Same input gives the same commands.
  const CommandBuffer first = LayoutDocument(job, config, page, encoder);
  const CommandBuffer second = LayoutDocument(job, config, page, encoder);
  if (first.commands.size() != second.commands.size() ||
      first.sources != second.sources) {
    std::cerr << "Layout is not deterministic\n";
    return 1;
  }
  for (size_t i = 0; i < first.commands.size(); ++i) {
    const CanvasBounds a = ComputeCommandBounds(first.commands[i]);
    const CanvasBounds b = ComputeCommandBounds(second.commands[i]);
    if (a.minX != b.minX || a.minY != b.minY || a.maxX != b.maxX ||
        a.maxY != b.maxY) {
      std::cerr << "Command " << i << " moved between runs\n";
      return 1;
    }
  }

  // And the same PDF bytes.
  const SheetPdfOptions pdfOptions;
  const std::string bytesA = RenderSheetPdf(first, page, pdfOptions);
  const std::string bytesB = RenderSheetPdf(second, page, pdfOptions);
  if (bytesA != bytesB) {
    std::cerr << "PDF output differs between runs\n";
    return 1;
  }
  if (bytesA.compare(0, 8, "%PDF-1.4") != 0 ||
      bytesA.find("/CreationDate") != std::string::npos) {
    std::cerr << "Unexpected PDF header or embedded timestamp\n";
    return 1;
  }

  // Full generation through files, twice.
  const auto dir = std::filesystem::temp_directory_path();
  const auto pathA = dir / "tallysheet_determinism_a.pdf";
  const auto pathB = dir / "tallysheet_determinism_b.pdf";
  SheetGenerationOptions options;
  options.encoder = &encoder;
  const auto resultA = GenerateDocument(job, pathA.string(), options);
  const auto resultB = GenerateDocument(job, pathB.string(), options);
  if (!resultA.success || !resultB.success) {
    std::cerr << "Generation failed: " << resultA.message << " / "
              << resultB.message << "\n";
    return 1;
  }
  const bool same = ReadFile(pathA) == ReadFile(pathB);
  std::filesystem::remove(pathA);
  std::filesystem::remove(pathB);
  if (!same) {
    std::cerr << "Generated files differ\n";
    return 1;
  }
  return 0;
}
