/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace tracedroid {

/* Invalid rule set or rule selection. Fatal, raised before scanning. */
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message);
};

/* The scan root is missing or is not a directory. Fatal. */
class DirectoryNotFoundError : public std::invalid_argument {
 public:
  explicit DirectoryNotFoundError(const std::filesystem::path& path);

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

/* A source file could not be opened or read. Recovered per file. */
class FileAccessError : public std::runtime_error {
 public:
  FileAccessError(const std::filesystem::path& path, const std::string& reason);

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

/**
 * A rule heuristic could not be evaluated for one occurrence. Rules run each
 * occurrence through `Rule::evaluate_occurrence`, which skips it; it never
 * leaves `Rule::analyze`.
 */
class RuleEvaluationError : public std::runtime_error {
 public:
  explicit RuleEvaluationError(const std::string& message);
};

} // namespace tracedroid
