#include "sheeterrors.h"

#include <cassert>
#include <cstring>
#include <string>

int main() {
  // Every failure category has its own exit status.
  assert(SheetErrorExitCode(SheetErrorKind::Validation) == 2);
  assert(SheetErrorExitCode(SheetErrorKind::Encoding) == 3);
  assert(SheetErrorExitCode(SheetErrorKind::LayoutOverflow) == 4);
  assert(SheetErrorExitCode(SheetErrorKind::Io) == 5);
  assert(SheetErrorExitCode(SheetErrorKind::None) == kExitFailure);
  assert(kExitOk == 0 && kExitFailure == 1);

  assert(std::strcmp(SheetErrorKindName(SheetErrorKind::LayoutOverflow),
                     "layout-overflow") == 0);
  assert(std::strcmp(SheetErrorKindName(SheetErrorKind::Io), "io") == 0);

  // Exceptions carry their category through the common base.
  const LayoutOverflowError overflow(22, 21);
  const SheetError &base = overflow;
  assert(base.Kind() == SheetErrorKind::LayoutOverflow);
  assert(SheetErrorExitCode(base.Kind()) == kExitOverflow);
  assert(overflow.Requested() == 22 && overflow.Capacity() == 21);
  assert(std::string(overflow.what()).find("capacity 21") !=
         std::string::npos);
  assert(SheetErrorExitCode(EncodingError("x").Kind()) == kExitEncoding);
  return 0;
}
