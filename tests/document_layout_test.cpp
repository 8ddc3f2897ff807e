#include "documentlayout.h"
#include "layoutconfig.h"
#include "sheet_test_support.h"

#include <iostream>

using namespace sheet;

namespace {

int CountMarkersWithPrefix(const CommandBuffer &buffer,
                           const std::string &prefix) {
  int count = 0;
  for (size_t i = 0; i < buffer.commands.size(); ++i) {
    if (StartsWith(buffer.sources[i], prefix) &&
        std::holds_alternative<MarkerCommand>(buffer.commands[i]))
      ++count;
  }
  return count;
}

bool HasSourcePrefix(const CommandBuffer &buffer, const std::string &prefix) {
  for (const auto &source : buffer.sources) {
    if (StartsWith(source, prefix))
      return true;
  }
  return false;
}

} // namespace

int main() {
  const LayoutConfig config;
  const PageGeometry page;
  FakeCodeEncoder encoder;

  // Two products A and B.
  {
    SheetJob job;
    job.client = {"7F3A9C", "Rodoltte"};
    job.products = {{"A", "A"}, {"B", "B"}};
    const CommandBuffer doc = LayoutDocument(job, config, page, encoder);

    if (CountMarkersWithPrefix(doc, "corner/") != 3) {
      std::cerr << "Expected three corner markers\n";
      return 1;
    }
    for (size_t i = 0; i < doc.commands.size(); ++i) {
      const auto *marker = std::get_if<MarkerCommand>(&doc.commands[i]);
      if (marker && marker->x > page.width / 2 && marker->y < page.height / 2) {
        std::cerr << "Bottom-right corner must stay empty\n";
        return 1;
      }
    }

    const auto labels = TextsWithPrefix(doc, "client/label");
    if (labels.size() != 1 || labels[0].text != "Client: Rodoltte" ||
        !Near(labels[0].x, 50.0) || !Near(labels[0].y, page.height - 50.0)) {
      std::cerr << "Client label misplaced\n";
      return 1;
    }

    const double y0 = RowBaseline(0, config, page);
    const double y1 = RowBaseline(1, config, page);
    if (!Near(y0 - y1, config.rowSpacing)) {
      std::cerr << "Rows must be one row spacing apart\n";
      return 1;
    }
    const double expectedY[] = {y0, y1};
    for (int r = 0; r < 2; ++r) {
      const std::string prefix = "row/" + std::to_string(r) + "/";
      if (CirclesWithPrefix(doc, prefix + "tens/").size() != 10 ||
          CirclesWithPrefix(doc, prefix + "ones/").size() != 10) {
        std::cerr << "Row " << r << " needs 10 Tens and 10 Ones bubbles\n";
        return 1;
      }
      const auto names = TextsWithPrefix(doc, prefix + "name");
      if (names.size() != 1 || names[0].text != (r == 0 ? "A" : "B") ||
          !Near(names[0].y, expectedY[r] - 10.0)) {
        std::cerr << "Row " << r << " name misplaced\n";
        return 1;
      }
    }
    if (ComputeSourceBounds(doc, "row/0/")
            .Overlaps(ComputeSourceBounds(doc, "row/1/"))) {
      std::cerr << "Rows A and B overlap\n";
      return 1;
    }
    CanvasBounds header = ComputeSourceBounds(doc, "client");
    header.Extend(ComputeSourceBounds(doc, "date"));
    if (header.Overlaps(ComputeSourceBounds(doc, "row/"))) {
      std::cerr << "Rows overlap the header\n";
      return 1;
    }

    // One image per distinct payload: client, A and B.
    if (doc.images.size() != 3) {
      std::cerr << "Expected three code images, got " << doc.images.size()
                << "\n";
      return 1;
    }
  }

  // No products: header only, still valid.
  {
    SheetJob job;
    job.client = {"CLIENT", "Empty"};
    const CommandBuffer doc = LayoutDocument(job, config, page, encoder);
    if (HasSourcePrefix(doc, "row/")) {
      std::cerr << "Empty product list must not produce rows\n";
      return 1;
    }
    if (CountMarkersWithPrefix(doc, "corner/") != 3 ||
        !HasSourcePrefix(doc, "client/code") ||
        CirclesWithPrefix(doc, "date/").empty()) {
      std::cerr << "Header sections missing for an empty sheet\n";
      return 1;
    }
  }

  // Repeated payloads reuse one image.
  {
    SheetJob job;
    job.client = {"X", "Same"};
    job.products = {{"One", "X"}, {"Two", "X"}};
    const CommandBuffer doc = LayoutDocument(job, config, page, encoder);
    if (doc.images.size() != 1) {
      std::cerr << "Identical payloads should share one image\n";
      return 1;
    }
  }

  // Empty payloads surface as encoding errors.
  {
    SheetJob job;
    job.client = {"", "No id"};
    bool threw = false;
    try {
      LayoutDocument(job, config, page, encoder);
    } catch (const EncodingError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Empty client id must fail to encode\n";
      return 1;
    }
  }

  return 0;
}
