#include "sheeterrors.h"
#include "stagedfile.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace {
std::string ReadFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}
} // namespace

int main() {
  const fs::path target = fs::temp_directory_path() / "tallysheet_staged.txt";
  fs::path temp = target;
  temp += ".tmp";
  fs::remove(target);

  // Commit moves the data into place and leaves no temporary file.
  {
    StagedFile file(target);
    file.Write("first");
    if (fs::exists(target) || !fs::exists(temp)) {
      std::cerr << "Data must stay staged until commit\n";
      return 1;
    }
    file.Commit();
  }
  if (ReadFile(target) != "first" || fs::exists(temp)) {
    std::cerr << "Committed file missing or temporary file left behind\n";
    return 1;
  }

  // Dropping an uncommitted file keeps the existing target.
  {
    StagedFile file(target);
    file.Write("second");
  }
  if (ReadFile(target) != "first" || fs::exists(temp)) {
    std::cerr << "Uncommitted data replaced the target\n";
    return 1;
  }

  // Committing twice, or without data, is refused.
  {
    StagedFile file(target);
    bool threw = false;
    try {
      file.Commit();
    } catch (const IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Commit without data accepted\n";
      return 1;
    }
  }
  fs::remove(target);

  // A destination in a missing folder fails with an I/O error.
  {
    const fs::path missing =
        fs::temp_directory_path() / "tallysheet_no_such_dir" / "out.pdf";
    bool threw = false;
    try {
      StagedFile file(missing);
      file.Write("data");
      file.Commit();
    } catch (const IoError &) {
      threw = true;
    }
    if (!threw || fs::exists(missing)) {
      std::cerr << "Writing into a missing folder should fail\n";
      return 1;
    }
  }

  return 0;
}
