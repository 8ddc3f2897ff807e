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

#include <string>
#include <vector>

// One counted item on the sheet. The id is used verbatim as the QR payload
// and does not need to be numeric.
struct Product {
  std::string name;
  std::string id;
};

// Client the audit sheet belongs to. The id is an opaque payload string.
struct ClientRecord {
  std::string id;
  std::string name;
};

// Everything needed to render one audit sheet.
struct SheetJob {
  ClientRecord client;
  std::vector<Product> products;
};
