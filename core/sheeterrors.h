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

#include <cstddef>
#include <stdexcept>
#include <string>

// Failure categories of one sheet generation. Every category is fatal to the
// generation call that raised it.
enum class SheetErrorKind { None, Validation, Encoding, Io, LayoutOverflow };

class SheetError : public std::runtime_error {
public:
  SheetError(SheetErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  SheetErrorKind Kind() const { return kind_; }

private:
  SheetErrorKind kind_;
};

// Malformed field spec, job input or layout configuration.
class ValidationError : public SheetError {
public:
  explicit ValidationError(const std::string &message)
      : SheetError(SheetErrorKind::Validation, message) {}
};

// The code encoder cannot represent a payload.
class EncodingError : public SheetError {
public:
  explicit EncodingError(const std::string &message)
      : SheetError(SheetErrorKind::Encoding, message) {}
};

// The output file could not be written.
class IoError : public SheetError {
public:
  explicit IoError(const std::string &message)
      : SheetError(SheetErrorKind::Io, message) {}
};

// More product rows than fit on one page.
class LayoutOverflowError : public SheetError {
public:
  LayoutOverflowError(size_t requested, size_t capacity)
      : SheetError(SheetErrorKind::LayoutOverflow,
                   std::to_string(requested) +
                       " products do not fit on one sheet (capacity " +
                       std::to_string(capacity) + " rows)"),
        requested_(requested), capacity_(capacity) {}

  size_t Requested() const { return requested_; }
  size_t Capacity() const { return capacity_; }

private:
  size_t requested_;
  size_t capacity_;
};

// Exit status of the tallysheet command.
enum SheetExitCode {
  kExitOk = 0,
  kExitFailure = 1,
  kExitValidation = 2,
  kExitEncoding = 3,
  kExitOverflow = 4,
  kExitIo = 5
};

const char *SheetErrorKindName(SheetErrorKind kind);
// Exit status reported for a failed generation. None maps to kExitFailure.
int SheetErrorExitCode(SheetErrorKind kind);
