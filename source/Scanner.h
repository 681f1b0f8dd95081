/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <trace-droid/Compiler.h>
#include <trace-droid/ContextExtractor.h>
#include <trace-droid/Filesystem.h>
#include <trace-droid/Finding.h>
#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Rules.h>
#include <trace-droid/ScanResult.h>
#include <trace-droid/SourceFile.h>

namespace tracedroid {

class Options;
class Statistics;

struct ScanSettings {
  // Extensions of the files to scan, with the leading dot.
  std::vector<std::string> extensions = {".kt", ".java"};
  // Paths relative to the root. A single name excludes every directory with
  // that name.
  std::vector<std::string> exclude_directories = {};
  std::size_t context_lines = k_default_context_lines;
  bool sequential = true;
  std::size_t jobs = 1;

  static ScanSettings from_options(const Options& options);
};

/* Candidate files of a tree, in a deterministic order. */
struct CandidateFiles {
  std::vector<std::filesystem::path> files;
  std::size_t skipped = 0;
};

/**
 * Walks a source tree and runs every rule on every candidate file.
 *
 * Errors reading or analyzing one file are logged and recorded in the
 * result; they never stop the scan. Only a bad configuration or a missing
 * root throws.
 */
class Scanner final {
 public:
  /* Throws `ConfigurationError` if there are no rules. */
  explicit Scanner(
      Rules rules,
      ScanSettings settings = ScanSettings(),
      filesystem::LineReader reader = filesystem::read_lines);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Scanner)

  const Rules& rules() const {
    return rules_;
  }

  const ScanSettings& settings() const {
    return settings_;
  }

  /**
   * Scan every candidate file under `root`. Throws `DirectoryNotFoundError`
   * if `root` is not a directory.
   */
  ScanResult scan(
      const std::filesystem::path& root,
      Statistics* TD_NULLABLE statistics = nullptr) const;

  /* Files under `root` matching the extensions, minus excluded ones. */
  CandidateFiles collect_files(const std::filesystem::path& root) const;

  /* Findings of all rules on an already read file. */
  std::vector<Finding> analyze(
      const SourceFile& file,
      std::vector<FailedFile>& failures) const;

 private:
  struct FileResult {
    std::vector<Finding> findings;
    std::vector<FailedFile> failures;
  };

  FileResult scan_file(const std::filesystem::path& path) const;

  bool is_excluded(const std::filesystem::path& relative_path) const;
  bool has_extension(const std::filesystem::path& path) const;

 private:
  Rules rules_;
  ScanSettings settings_;
  filesystem::LineReader reader_;
  ContextExtractor context_extractor_;
};

} // namespace tracedroid
