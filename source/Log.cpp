/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <fmt/chrono.h>

#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Log.h>

namespace {

struct LoggerImplementation {
 public:
  LoggerImplementation() : level_(1), file_(stderr) {
    const char* env = std::getenv("TRACE");
    if (env) {
      parse_environment(env);
    }
  }

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(LoggerImplementation)

  void set_level(int level) {
    level_.store(level, std::memory_order_relaxed);
  }

  int get_level() const {
    return level_.load(std::memory_order_relaxed);
  }

  // Called from every scanning worker, hence the atomic level.
  bool enabled(int level) const {
    return level <= get_level();
  }

  void log(std::string_view section, int level, std::string_view message) {
    if (!enabled(level)) {
      return;
    }

    std::time_t current_time = std::time(nullptr);
    std::string line = fmt::format(
        "{:%Y-%m-%d %H:%M:%S} {} {}\n",
        fmt::localtime(current_time),
        section,
        message);

    std::lock_guard<std::mutex> guard(mutex_);
    fwrite(line.c_str(), line.size(), 1, file_);
    fflush(file_);
  }

 private:
  // Accepts the same `MODULE:level,MODULE:level` syntax as other tools that
  // read `TRACE`, and only keeps the `TRACE_DROID` entry.
  void parse_environment(std::string_view configuration) {
    std::string module;
    std::string token;

    while (!configuration.empty()) {
      auto next_token_position = configuration.find_first_of(",: ");
      if (next_token_position != std::string::npos) {
        token = configuration.substr(0, next_token_position);
        configuration = configuration.substr(next_token_position + 1);
      } else {
        token = configuration;
        configuration = {};
      }

      int level = std::atoi(token.c_str());
      if (!level) {
        module = token;
      } else if (module == "TRACE_DROID") {
        set_level(level);
      }
    }
  }

 private:
  std::atomic<int> level_;
  FILE* file_;
  std::mutex mutex_;
};

static LoggerImplementation logger;

} // namespace

namespace tracedroid {

void Logger::set_level(int level) {
  logger.set_level(level);
}

int Logger::get_level() {
  return logger.get_level();
}

bool Logger::enabled(int level) {
  return logger.enabled(level);
}

void Logger::log(
    std::string_view section,
    int level,
    std::string_view message) {
  logger.log(section, level, message);
}

} // namespace tracedroid
