/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <trace-droid/Finding.h>
#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Severity.h>

namespace tracedroid {

/* A file that could not be analyzed. */
struct FailedFile {
  std::filesystem::path path;
  std::string reason;

  bool operator==(const FailedFile& other) const {
    return path == other.path && reason == other.reason;
  }
};

/**
 * Everything found by one scan: findings from every file and rule, files
 * that could not be analyzed, and file counts.
 */
class ScanResult final {
 public:
  ScanResult() = default;

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(ScanResult)

  void add(Finding finding);
  void add(std::vector<Finding> findings);
  void add_failed_file(FailedFile failed_file);

  void set_files_scanned(std::size_t files_scanned) {
    files_scanned_ = files_scanned;
  }

  void set_files_skipped(std::size_t files_skipped) {
    files_skipped_ = files_skipped;
  }

  /* Findings in insertion order. */
  const std::vector<Finding>& findings() const {
    return findings_;
  }

  /* Findings ordered by file path, line number, rule name and detail. */
  std::vector<Finding> sorted() const;

  const std::vector<FailedFile>& failed_files() const {
    return failed_files_;
  }

  std::size_t files_scanned() const {
    return files_scanned_;
  }

  std::size_t files_skipped() const {
    return files_skipped_;
  }

  bool empty() const {
    return findings_.empty();
  }

  std::size_t count(Severity severity) const;

  /* Returns true if any finding is at least as severe as `threshold`. */
  bool has_findings_at_least(Severity threshold) const;

 private:
  std::vector<Finding> findings_;
  std::vector<FailedFile> failed_files_;
  std::size_t files_scanned_ = 0;
  std::size_t files_skipped_ = 0;
};

} // namespace tracedroid
