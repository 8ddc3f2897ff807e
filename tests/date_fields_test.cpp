#include "fieldlayouts.h"
#include "sheet_test_support.h"

#include <iostream>
#include <set>

using namespace sheet;

namespace {

// Digits offered by one column of a date field, read back from its bubbles.
std::set<int> ColumnDigits(const CommandBuffer &buffer, const std::string &field,
                           int column) {
  std::set<int> digits;
  const std::string prefix = field + "/" + std::to_string(column) + "/";
  for (const auto &[key, circle] : CirclesWithPrefix(buffer, prefix))
    digits.insert(std::stoi(key.substr(prefix.size())));
  return digits;
}

std::set<int> Representable(const CommandBuffer &buffer,
                            const std::string &field) {
  std::set<int> values;
  for (int tens : ColumnDigits(buffer, field, 0))
    for (int ones : ColumnDigits(buffer, field, 1))
      values.insert(tens * 10 + ones);
  return values;
}

} // namespace

int main() {
  const LayoutConfig config;
  const CommandBuffer buffer = LayoutDateFields(300.0, 791.89, config);

  const auto day = Representable(buffer, "Day");
  if (day.size() != 40 || *day.begin() != 0 || *day.rbegin() != 39) {
    std::cerr << "Day should represent exactly 00-39, got " << day.size()
              << " values\n";
    return 1;
  }
  const auto month = Representable(buffer, "Month");
  if (month.size() != 20 || *month.begin() != 0 || *month.rbegin() != 19) {
    std::cerr << "Month should represent exactly 00-19\n";
    return 1;
  }
  const auto year = Representable(buffer, "Year");
  if (year.size() != 100) {
    std::cerr << "Year should represent 00-99\n";
    return 1;
  }

  // Fields sit at x, x + gap and x + 2 * gap on the same baseline.
  const char *fields[] = {"Day", "Month", "Year"};
  for (int i = 0; i < 3; ++i) {
    const auto labels = TextsWithPrefix(buffer, std::string(fields[i]) + "/label");
    if (labels.size() != 1 || labels[0].text != std::string(fields[i]) + ":" ||
        !Near(labels[0].x, 300.0 + i * config.fieldGap) ||
        !Near(labels[0].y, 791.89)) {
      std::cerr << fields[i] << " label misplaced\n";
      return 1;
    }
    const auto top = CirclesWithPrefix(buffer, std::string(fields[i]) + "/1/9");
    if (top.size() != 1 ||
        !Near(top[0].second.cx,
              300.0 + i * config.fieldGap + config.columnSpacing) ||
        !Near(top[0].second.cy, 791.89 - config.bubbleDrop)) {
      std::cerr << fields[i] << " second column should start with 9 on top\n";
      return 1;
    }
  }

  // Day's leading column stacks 3,2,1,0 and stops there.
  const auto dayLead = CirclesWithPrefix(buffer, "Day/0/");
  if (dayLead.size() != 4 || dayLead.front().first != "Day/0/3" ||
      dayLead.back().first != "Day/0/0" ||
      !Near(dayLead.back().second.cy,
            791.89 - config.bubbleDrop - 3 * config.digitSpacing)) {
    std::cerr << "Day leading column layout wrong\n";
    return 1;
  }

  return 0;
}
