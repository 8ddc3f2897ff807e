#include "documentlayout.h"
#include "regionmap.h"
#include "sheet_test_support.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>

using namespace sheet;

int main() {
  const LayoutConfig config;
  const PageGeometry page;
  FakeCodeEncoder encoder;

  SheetJob job;
  job.client = {"CLIENT-1", "Rodoltte"};
  job.products = {{"A", "A"}, {"B", "B-2"}};
  const CommandBuffer doc = LayoutDocument(job, config, page, encoder);
  const nlohmann::json map =
      nlohmann::json::parse(BuildRegionMap(doc, job, page, 150.0));

  if (map["dpi"].get<double>() != 150.0 ||
      map["client"]["payload"] != "CLIENT-1") {
    std::cerr << "Region map header wrong\n";
    return 1;
  }
  const auto &clientCode = map["client"]["code"];
  if (!Near(clientCode["x"].get<double>(), 50.0) ||
      !Near(clientCode["y"].get<double>(), page.height - 135.0) ||
      !Near(clientCode["width"].get<double>(), kCodeNominalSizePt)) {
    std::cerr << "Client code box wrong\n";
    return 1;
  }

  // 4 + 10 Day, 2 + 10 Month and 10 + 10 Year bubbles.
  if (map["date"].size() != 46) {
    std::cerr << "Expected 46 date bubbles, got " << map["date"].size() << "\n";
    return 1;
  }

  const auto &rows = map["rows"];
  if (rows.size() != 2 || rows[1]["payload"] != "B-2" ||
      rows[1]["name"] != "B") {
    std::cerr << "Row entries wrong\n";
    return 1;
  }
  for (const auto &row : rows) {
    if (row["tens"]["bubbles"].size() != 10 ||
        row["ones"]["bubbles"].size() != 10) {
      std::cerr << "Each row needs 10 Tens and 10 Ones regions\n";
      return 1;
    }
  }

  // Tens 0 of row 0: centre (200, H - 202) -> pixels from the top-left.
  const auto &zero = rows[0]["tens"]["bubbles"][0];
  const double scale = 150.0 / 72.0;
  if (zero["digit"] != 0 || !Near(zero["center"]["x"].get<double>(), 200.0) ||
      !Near(zero["center"]["y"].get<double>(), page.height - 202.0, 1e-4) ||
      zero["pixel"]["x"] != std::lround(200.0 * scale) ||
      zero["pixel"]["y"] != std::lround(202.0 * scale)) {
    std::cerr << "Tens 0 region wrong: " << zero.dump() << "\n";
    return 1;
  }

  // Row 1 sits one row spacing lower in pixel space.
  const long top0 = rows[0]["code"]["pixels"]["top"].get<long>();
  const long top1 = rows[1]["code"]["pixels"]["top"].get<long>();
  if (std::abs((top1 - top0) - std::lround(config.rowSpacing * scale)) > 1) {
    std::cerr << "Row pixel pitch wrong\n";
    return 1;
  }

  bool threw = false;
  try {
    BuildRegionMap(doc, job, page, 0.0);
  } catch (const ValidationError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Zero dpi accepted\n";
    return 1;
  }
  return 0;
}
