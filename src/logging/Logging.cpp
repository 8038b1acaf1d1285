// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/Logging.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace wave {

namespace {

std::atomic<Log::Level> gThreshold{Log::Level::Info};

char levelToChar(Log::Level level) {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  }
  return 'U';
}

} // namespace

void Log::set_threshold(Level level) noexcept { gThreshold.store(level, std::memory_order_relaxed); }

auto Log::threshold() noexcept -> Level { return gThreshold.load(std::memory_order_relaxed); }

auto Log::enabled(Level level) noexcept -> bool {
  return static_cast<int>(level) >= static_cast<int>(threshold());
}

void Log::vlog(Level level, const std::source_location& location, std::string_view fmt,
               std::format_args args) {
  std::string message = std::vformat(fmt, args);
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename();
  int pid = ::getpid();
  int tid = ::gettid();
  std::fprintf(stderr, "[%s:%u] %c %d-%d %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

auto parse_log_level(std::string_view text, Log::Level& level) noexcept -> bool {
  if (text == "debug") {
    level = Log::Level::Debug;
  } else if (text == "info") {
    level = Log::Level::Info;
  } else if (text == "warning") {
    level = Log::Level::Warning;
  } else if (text == "error") {
    level = Log::Level::Error;
  } else {
    return false;
  }
  return true;
}

} // namespace wave
