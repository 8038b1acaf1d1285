// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <format>
#include <source_location>
#include <string_view>

namespace wave {

// Line oriented logger writing to stderr.
//
// Usage: Log::i("Saved {} images", count);
// Messages below the current threshold (Info by default) are dropped before formatting.
struct Log {
  enum class Level { Debug, Info, Warning, Error };

  static void set_threshold(Level level) noexcept;
  static auto threshold() noexcept -> Level;
  static auto enabled(Level level) noexcept -> bool;

  static void vlog(Level, const std::source_location& location, std::string_view fmt,
                   std::format_args args);

  template <typename... Args>
  static void log(Level level, const std::source_location& location, std::string_view fmt,
                  Args&&... args) {
    if (!enabled(level)) {
      return;
    }
    vlog(level, location, fmt, std::make_format_args(args...));
  }

  template <typename... Args> struct d {
    d(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Debug, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> d(std::string_view, Args&&...) -> d<Args...>;

  template <typename... Args> struct i {
    i(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Info, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> i(std::string_view, Args&&...) -> i<Args...>;

  template <typename... Args> struct w {
    w(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Warning, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> w(std::string_view, Args&&...) -> w<Args...>;

  template <typename... Args> struct e {
    e(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Error, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> e(std::string_view, Args&&...) -> e<Args...>;
};

// Parses "debug", "info", "warning" or "error". Returns false and leaves level untouched
// for anything else.
auto parse_log_level(std::string_view text, Log::Level& level) noexcept -> bool;

} // namespace wave
