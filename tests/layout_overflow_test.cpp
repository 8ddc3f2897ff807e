#include "documentlayout.h"
#include "sheet_test_support.h"

#include <iostream>

using namespace sheet;

namespace {
SheetJob MakeJob(size_t products) {
  SheetJob job;
  job.client = {"CLIENT", "Overflow"};
  for (size_t i = 0; i < products; ++i)
    job.products.push_back({"Item " + std::to_string(i),
                            "ID" + std::to_string(i)});
  return job;
}
} // namespace

int main() {
  const LayoutConfig config;
  const PageGeometry page;

  // A full page lays out.
  {
    FakeCodeEncoder encoder;
    const CommandBuffer doc = LayoutDocument(MakeJob(21), config, page, encoder);
    const CanvasBounds rows = ComputeSourceBounds(doc, "row/");
    if (!rows.valid || rows.minY < page.markerSize) {
      std::cerr << "Last row runs into the bottom marker band\n";
      return 1;
    }
  }

  // One more row than fits is rejected before the rows are encoded.
  {
    FakeCodeEncoder encoder;
    bool threw = false;
    try {
      LayoutDocument(MakeJob(22), config, page, encoder);
    } catch (const LayoutOverflowError &ex) {
      threw = ex.Requested() == 22 && ex.Capacity() == 21;
    }
    if (!threw) {
      std::cerr << "22 products should overflow a 21 row page\n";
      return 1;
    }
    if (encoder.calls != 2) {
      std::cerr << "Overflow should be detected after the first row, "
                << encoder.calls << " encodes\n";
      return 1;
    }
  }

  // Rows closer than their own height are a configuration error.
  {
    FakeCodeEncoder encoder;
    LayoutConfig tight;
    tight.rowSpacing = 20.0;
    bool threw = false;
    try {
      LayoutDocument(MakeJob(2), tight, page, encoder);
    } catch (const ValidationError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Overlapping rows were not rejected\n";
      return 1;
    }
  }

  // Starting the rows inside the header is rejected as well.
  {
    FakeCodeEncoder encoder;
    LayoutConfig high;
    high.rowSectionOffset = 120.0;
    bool threw = false;
    try {
      LayoutDocument(MakeJob(1), high, page, encoder);
    } catch (const ValidationError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Rows overlapping the header were not rejected\n";
      return 1;
    }
  }

  // Fields pushed past the right page edge are rejected, not clipped.
  {
    LayoutConfig wideGap;
    wideGap.quantityGap = 200.0;
    LayoutConfig wideDates;
    wideDates.fieldGap = 250.0;
    const struct {
      const char *what;
      LayoutConfig config;
      size_t products;
    } cases[] = {{"quantity gap", wideGap, 1},
                 {"date field gap", wideDates, 1},
                 {"date field gap without products", wideDates, 0}};
    for (const auto &c : cases) {
      FakeCodeEncoder encoder;
      bool threw = false;
      try {
        LayoutDocument(MakeJob(c.products), c.config, page, encoder);
      } catch (const ValidationError &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "Off-page layout accepted for " << c.what << "\n";
        return 1;
      }
    }

    // The default sheet stays inside the page.
    FakeCodeEncoder encoder;
    const CanvasBounds all =
        ComputeBufferBounds(LayoutDocument(MakeJob(21), config, page, encoder));
    if (all.minX < 0.0 || all.maxX > page.width + 1e-6 || all.minY < 0.0 ||
        all.maxY > page.height + 1e-6) {
      std::cerr << "Default sheet leaves the page\n";
      return 1;
    }
  }

  // Bubble pitches below a bubble diameter are invalid.
  {
    LayoutConfig cramped;
    cramped.quantitySpacing = 6.0;
    bool threw = false;
    try {
      ValidateLayoutConfig(cramped, page);
    } catch (const ValidationError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Cramped quantity spacing accepted\n";
      return 1;
    }
  }

  return 0;
}
