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
#include "stagedfile.h"

#include "sheeterrors.h"

#include <fstream>
#include <system_error>
#include <utility>

StagedFile::StagedFile(std::filesystem::path target)
    : target_(std::move(target)) {
  tempPath_ = target_;
  tempPath_ += ".tmp";
}

StagedFile::~StagedFile() {
  if (!committed_)
    Discard();
}

void StagedFile::Write(const std::string &bytes) {
  if (committed_)
    throw IoError("File already committed: " + target_.string());
  written_ = true;
  std::ofstream file(tempPath_, std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    throw IoError("Unable to open the destination file for writing: " +
                  target_.string());
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file)
    throw IoError("Failed to write data to " + tempPath_.string());
}

void StagedFile::Commit() {
  if (!written_ || committed_)
    throw IoError("Nothing staged for " + target_.string());
  std::error_code ec;
  std::filesystem::rename(tempPath_, target_, ec);
  if (ec)
    throw IoError("Unable to move " + tempPath_.string() + " into place at " +
                  target_.string() + ": " + ec.message());
  committed_ = true;
}

void StagedFile::Discard() {
  if (!written_)
    return;
  std::error_code ignored;
  std::filesystem::remove(tempPath_, ignored);
}
