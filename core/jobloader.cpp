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
#include "jobloader.h"

#include "sheeterrors.h"
#include "stringutils.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace {

std::string OptionalString(const nlohmann::json &obj, const char *key,
                           const std::string &context) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return {};
  if (!it->is_string())
    throw ValidationError(context + "." + key + " must be a string");
  return it->get<std::string>();
}

} // namespace

SheetJob ParseSheetJob(const std::string &text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &ex) {
    throw ValidationError(std::string("job file is not valid JSON: ") +
                          ex.what());
  }
  if (!j.is_object())
    throw ValidationError("job file must contain a JSON object");

  SheetJob job;
  auto client = j.find("client");
  if (client == j.end() || !client->is_object())
    throw ValidationError("job file needs a \"client\" object");
  job.client.id = OptionalString(*client, "id", "client");
  job.client.name = OptionalString(*client, "name", "client");

  auto products = j.find("products");
  if (products == j.end() || products->is_null())
    return job;
  if (!products->is_array())
    throw ValidationError("\"products\" must be an array");

  for (size_t i = 0; i < products->size(); ++i) {
    const auto &entry = (*products)[i];
    const std::string context = "products[" + std::to_string(i) + "]";
    if (!entry.is_object())
      throw ValidationError(context + " must be an object");
    Product product;
    product.name = OptionalString(entry, "name", context);
    product.id = OptionalString(entry, "id", context);
    if (product.id.empty())
      product.id = product.name;
    if (product.id.empty())
      throw ValidationError(context + " needs a name or an id");
    job.products.push_back(std::move(product));
  }
  return job;
}

SheetJob LoadSheetJob(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw ValidationError("Unable to open job file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ParseSheetJob(ss.str());
}

Product ParseProductArgument(const std::string &argument) {
  Product product;
  if (auto parts = StringUtils::SplitLast(argument, '=')) {
    product.name = parts->first;
    product.id = parts->second;
  } else {
    product.name = argument;
  }
  if (product.id.empty())
    product.id = product.name;
  if (product.id.empty())
    throw ValidationError("empty product argument '" + argument + "'");
  return product;
}
