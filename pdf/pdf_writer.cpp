#include "pdf_writer.h"

#include <iomanip>
#include <sstream>

namespace sheet_pdf_internal {

std::string SerializePdfDocument(const std::vector<PdfObject> &objects,
                                 size_t catalogObjectIndex) {
  std::ostringstream file;
  // Binary marker comment so transfer tools keep the file 8-bit clean.
  file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
  std::vector<long> offsets;
  offsets.reserve(objects.size());
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(static_cast<long>(file.tellp()));
    file << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
  }

  long xrefPos = static_cast<long>(file.tellp());
  file << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
  for (long off : offsets)
    file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";

  file << "trailer\n<< /Size " << (objects.size() + 1) << " /Root "
       << catalogObjectIndex << " 0 R >>\nstartxref\n"
       << xrefPos << "\n%%EOF\n";
  return file.str();
}

} // namespace sheet_pdf_internal
