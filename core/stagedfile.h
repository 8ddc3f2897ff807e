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
#pragma once

#include <filesystem>
#include <string>

// Output file written next to its destination as "<target>.tmp" and moved
// into place by Commit. A staged file that was never committed is removed
// when the object is destroyed, leaving any existing target untouched.
class StagedFile {
public:
  explicit StagedFile(std::filesystem::path target);
  ~StagedFile();

  StagedFile(const StagedFile &) = delete;
  StagedFile &operator=(const StagedFile &) = delete;

  // Throws IoError when the temporary file cannot be written.
  void Write(const std::string &bytes);
  // Renames the temporary file over the target. Throws IoError.
  void Commit();

  const std::filesystem::path &Target() const { return target_; }
  const std::filesystem::path &TempPath() const { return tempPath_; }

private:
  void Discard();

  std::filesystem::path target_;
  std::filesystem::path tempPath_;
  bool written_ = false;
  bool committed_ = false;
};
