#include "jobloader.h"
#include "sheeterrors.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
bool RejectsJob(const std::string &text) {
  try {
    ParseSheetJob(text);
  } catch (const ValidationError &) {
    return true;
  }
  return false;
}
} // namespace

int main() {
  const std::string text = R"({
    "client": { "id": "7F3A9C", "name": "Rodoltte" },
    "products": [
      { "name": "Rol de Canela", "id": "Rol de Canela" },
      { "name": "Concha" },
      { "name": "Pan = Dulce", "id": "PD-7" }
    ]
  })";
  const SheetJob job = ParseSheetJob(text);
  if (job.client.id != "7F3A9C" || job.client.name != "Rodoltte" ||
      job.products.size() != 3) {
    std::cerr << "Job fields not read\n";
    return 1;
  }
  if (job.products[1].id != "Concha") {
    std::cerr << "Product id should default to its name\n";
    return 1;
  }
  if (job.products[2].name != "Pan = Dulce" || job.products[2].id != "PD-7") {
    std::cerr << "Product names must be kept verbatim\n";
    return 1;
  }

  // The client id may come from the command line instead.
  const SheetJob noId = ParseSheetJob(R"({"client": {"name": "X"}})");
  if (!noId.client.id.empty() || !noId.products.empty()) {
    std::cerr << "Missing id and products should stay empty\n";
    return 1;
  }

  if (!RejectsJob("not json") || !RejectsJob("[]") ||
      !RejectsJob(R"({"products": []})") ||
      !RejectsJob(R"({"client": {"name": 5}})") ||
      !RejectsJob(R"({"client": {}, "products": {}})") ||
      !RejectsJob(R"({"client": {}, "products": [ "A" ]})") ||
      !RejectsJob(R"({"client": {}, "products": [ {} ]})")) {
    std::cerr << "Malformed job accepted\n";
    return 1;
  }

  // Loading from disk.
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "tallysheet_job_test.json";
  {
    std::ofstream out(path);
    out << text;
  }
  const SheetJob loaded = LoadSheetJob(path.string());
  std::filesystem::remove(path);
  if (loaded.products.size() != 3) {
    std::cerr << "LoadSheetJob lost products\n";
    return 1;
  }
  bool threw = false;
  try {
    LoadSheetJob(path.string());
  } catch (const ValidationError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Missing job file should be reported\n";
    return 1;
  }

  // Command line products split at the last '='.
  const Product a = ParseProductArgument("Pan = Dulce=PD-7");
  const Product b = ParseProductArgument("Concha");
  if (a.name != "Pan = Dulce" || a.id != "PD-7" || b.name != "Concha" ||
      b.id != "Concha") {
    std::cerr << "Product arguments parsed incorrectly\n";
    return 1;
  }
  threw = false;
  try {
    ParseProductArgument("=");
  } catch (const ValidationError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Empty product argument accepted\n";
    return 1;
  }
  return 0;
}
