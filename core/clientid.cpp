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
#include "clientid.h"

#include <random>

std::string GenerateClientId(size_t length) {
  static std::mt19937_64 rng{std::random_device{}()};
  static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::uniform_int_distribution<int> dist(0, sizeof(alphabet) - 2);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i)
    out.push_back(alphabet[dist(rng)]);
  return out;
}
