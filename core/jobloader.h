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

#include "sheetjob.h"

#include <string>

// Reads a job description:
//   { "client": { "id": "...", "name": "..." },
//     "products": [ { "name": "...", "id": "..." }, ... ] }
// "client.id" may be omitted when the caller supplies one; a product without
// "id" uses its name. Throws ValidationError for malformed input.
SheetJob LoadSheetJob(const std::string &path);
SheetJob ParseSheetJob(const std::string &text);

// "Name=ID" from the command line. The split happens at the last '=' so the
// name may contain one; "Name" alone uses the name as id.
Product ParseProductArgument(const std::string &argument);
