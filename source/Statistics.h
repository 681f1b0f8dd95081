/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

#include <trace-droid/Timer.h>

namespace tracedroid {

/**
 * Record various statistics during the scan.
 */
class Statistics final {
 public:
  Statistics() = default;

  Statistics(const Statistics&) = delete;
  Statistics(Statistics&&) = delete;
  Statistics& operator=(const Statistics& other) = delete;
  Statistics& operator=(Statistics&& other) = delete;
  ~Statistics() = default;

  void log_jobs(std::size_t jobs);
  void log_files(std::size_t scanned, std::size_t skipped, std::size_t failed);
  void log_findings(const std::string& rule_name, std::size_t findings);
  void log_time(const std::string& name, const Timer& timer);
  void log_file_time(const std::filesystem::path& file, const Timer& timer);

  Json::Value to_json() const;

  /* Maximum number of slowest files to record. */
  constexpr static std::size_t kRecordSlowestFiles = 20;

 private:
  mutable std::mutex mutex_;

  std::size_t jobs_ = 1;
  std::size_t files_scanned_ = 0;
  std::size_t files_skipped_ = 0;
  std::size_t files_failed_ = 0;

  // Number of findings for each rule. Ordered for a stable output.
  std::map<std::string, std::size_t> findings_;

  // Recorded times for each step of the scan.
  std::unordered_map<std::string, double> times_;

  // Sorted list of slowest files to analyze (from slowest to fastest).
  std::vector<std::pair<std::filesystem::path, double>> slowest_files_;
};

} // namespace tracedroid
