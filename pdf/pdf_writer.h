#pragma once

#include "pdf_objects.h"

#include <string>
#include <vector>

namespace sheet_pdf_internal {

// Serializes objects (numbered from 1) with header, xref table and trailer.
std::string SerializePdfDocument(const std::vector<PdfObject> &objects,
                                 size_t catalogObjectIndex);

} // namespace sheet_pdf_internal
