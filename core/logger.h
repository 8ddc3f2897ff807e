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
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// Simple asynchronous logger that writes messages to stderr and a log file.
// The file defaults to "tallysheet.log" and follows TALLYSHEET_LOG_FILE when
// that variable is set (an empty value disables the file).
class Logger {
public:
  enum class Level { Info, Warning, Error };

  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(const std::string &msg, Level level = Level::Info);
  void Warn(const std::string &msg) { Log(msg, Level::Warning); }
  void Error(const std::string &msg) { Log(msg, Level::Error); }

  // Block until every queued message has been written.
  void Flush();

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool writing_ = false;
  bool done_ = false;
  std::thread worker_;
};
