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

#include "regionmap.h"

#include "sheeterrors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <vector>

namespace sheet {

namespace {

std::vector<std::string> SplitKey(const std::string &key) {
  std::vector<std::string> parts;
  std::stringstream ss(key);
  std::string part;
  while (std::getline(ss, part, '/'))
    parts.push_back(part);
  return parts;
}

bool ParseIndex(const std::string &text, size_t &out) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos)
    return false;
  out = static_cast<size_t>(std::stoul(text));
  return true;
}

class PixelMapper {
public:
  PixelMapper(const PageGeometry &page, double dpi)
      : pageHeight_(page.height), scale_(dpi / 72.0) {}

  nlohmann::json Point(double x, double y) const {
    return {{"x", x}, {"y", y}};
  }

  nlohmann::json Pixel(double x, double y) const {
    return {{"x", std::lround(x * scale_)},
            {"y", std::lround((pageHeight_ - y) * scale_)}};
  }

  nlohmann::json Box(const CanvasBounds &b) const {
    nlohmann::json box = {{"x", b.minX},
                          {"y", b.minY},
                          {"width", b.Width()},
                          {"height", b.Height()}};
    box["pixels"] = {{"left", std::lround(b.minX * scale_)},
                     {"top", std::lround((pageHeight_ - b.maxY) * scale_)},
                     {"width", std::lround(b.Width() * scale_)},
                     {"height", std::lround(b.Height() * scale_)}};
    return box;
  }

  nlohmann::json Bubble(const CircleCommand &c, int digit) const {
    return {{"digit", digit},
            {"center", Point(c.cx, c.cy)},
            {"pixel", Pixel(c.cx, c.cy)},
            {"radius", c.radius}};
  }

private:
  double pageHeight_;
  double scale_;
};

struct StripRegions {
  CanvasBounds bounds;
  nlohmann::json bubbles = nlohmann::json::array();
};

struct RowRegions {
  CanvasBounds code;
  StripRegions tens;
  StripRegions ones;
};

} // namespace

std::string BuildRegionMap(const CommandBuffer &document, const SheetJob &job,
                           const PageGeometry &page, double dpi) {
  if (!(dpi > 0.0))
    throw ValidationError("region map dpi must be positive");

  const PixelMapper mapper(page, dpi);
  nlohmann::json date = nlohmann::json::array();
  CanvasBounds clientCode;
  std::map<size_t, RowRegions> rows;

  const size_t count =
      std::min(document.commands.size(), document.sources.size());
  for (size_t i = 0; i < count; ++i) {
    const auto parts = SplitKey(document.sources[i]);
    const CanvasCommand &cmd = document.commands[i];
    if (parts.empty())
      continue;

    if (parts[0] == "client" && parts.size() == 2 && parts[1] == "code" &&
        std::holds_alternative<ImageCommand>(cmd)) {
      clientCode.Extend(ComputeCommandBounds(cmd));
    } else if (parts[0] == "date" && parts.size() == 4) {
      const auto *circle = std::get_if<CircleCommand>(&cmd);
      size_t column = 0;
      size_t digit = 0;
      if (!circle || !ParseIndex(parts[2], column) ||
          !ParseIndex(parts[3], digit))
        continue;
      nlohmann::json bubble = mapper.Bubble(*circle, static_cast<int>(digit));
      bubble["field"] = parts[1];
      bubble["column"] = column;
      date.push_back(std::move(bubble));
    } else if (parts[0] == "row" && parts.size() >= 3) {
      size_t index = 0;
      if (!ParseIndex(parts[1], index))
        continue;
      RowRegions &row = rows[index];
      if (parts[2] == "code" && std::holds_alternative<ImageCommand>(cmd)) {
        row.code.Extend(ComputeCommandBounds(cmd));
      } else if ((parts[2] == "tens" || parts[2] == "ones") &&
                 parts.size() == 4) {
        const auto *circle = std::get_if<CircleCommand>(&cmd);
        size_t digit = 0;
        if (!circle || !ParseIndex(parts[3], digit))
          continue;
        StripRegions &strip = parts[2] == "tens" ? row.tens : row.ones;
        strip.bounds.Extend(ComputeCommandBounds(cmd));
        strip.bubbles.push_back(
            mapper.Bubble(*circle, static_cast<int>(digit)));
      }
    }
  }

  nlohmann::json root;
  root["dpi"] = dpi;
  root["page"] = {{"width", page.width},
                  {"height", page.height},
                  {"pixelWidth", std::lround(page.width * dpi / 72.0)},
                  {"pixelHeight", std::lround(page.height * dpi / 72.0)}};
  root["client"] = {{"payload", job.client.id},
                    {"code", mapper.Box(clientCode)}};
  root["date"] = std::move(date);

  nlohmann::json rowList = nlohmann::json::array();
  for (const auto &[index, row] : rows) {
    nlohmann::json entry;
    entry["index"] = index;
    if (index < job.products.size()) {
      entry["name"] = job.products[index].name;
      entry["payload"] = job.products[index].id;
    }
    entry["code"] = mapper.Box(row.code);
    entry["tens"] = mapper.Box(row.tens.bounds);
    entry["tens"]["bubbles"] = row.tens.bubbles;
    entry["ones"] = mapper.Box(row.ones.bounds);
    entry["ones"]["bubbles"] = row.ones.bubbles;
    rowList.push_back(std::move(entry));
  }
  root["rows"] = std::move(rowList);
  return root.dump(2);
}

} // namespace sheet
