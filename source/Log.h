/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace tracedroid {

class Logger {
 public:
  static void set_level(int level);
  static int get_level();
  static bool enabled(int level);

  template <typename... Args>
  static void log(
      std::string_view section,
      int level,
      std::string_view format,
      const Args&... args) {
    log(section, level, fmt::format(fmt::runtime(format), args...));
  }

  static void
  log(std::string_view section, int level, std::string_view message);
};

} // namespace tracedroid

#define SECTION(section, level, format, ...)                         \
  do {                                                               \
    if (tracedroid::Logger::enabled(level)) {                        \
      tracedroid::Logger::log(section, level, format, ##__VA_ARGS__); \
    }                                                                \
  } while (0)

#define LOG(level, format, ...)                    \
  do {                                             \
    SECTION("INFO", level, format, ##__VA_ARGS__); \
  } while (0)

#define WARNING(level, format, ...)                   \
  do {                                                \
    SECTION("WARNING", level, format, ##__VA_ARGS__); \
  } while (0)

#define ERROR(level, format, ...)                   \
  do {                                              \
    SECTION("ERROR", level, format, ##__VA_ARGS__); \
  } while (0)
