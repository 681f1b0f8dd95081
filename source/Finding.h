/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

#include <json/json.h>

#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Severity.h>

namespace tracedroid {

/* One detected issue at a given line of a given file. */
class Finding final {
 public:
  explicit Finding(
      std::filesystem::path file_path,
      std::size_t line_number,
      std::string issue_type,
      std::string matched_code,
      std::string detail,
      Severity severity,
      std::string suggestion,
      std::string rule_name,
      std::string context)
      : file_path_(std::move(file_path)),
        line_number_(line_number),
        issue_type_(std::move(issue_type)),
        matched_code_(std::move(matched_code)),
        detail_(std::move(detail)),
        severity_(severity),
        suggestion_(std::move(suggestion)),
        rule_name_(std::move(rule_name)),
        context_(std::move(context)) {}

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Finding)

  const std::filesystem::path& file_path() const {
    return file_path_;
  }

  std::size_t line_number() const {
    return line_number_;
  }

  const std::string& issue_type() const {
    return issue_type_;
  }

  const std::string& matched_code() const {
    return matched_code_;
  }

  const std::string& detail() const {
    return detail_;
  }

  Severity severity() const {
    return severity_;
  }

  const std::string& suggestion() const {
    return suggestion_;
  }

  const std::string& rule_name() const {
    return rule_name_;
  }

  /* Numbered lines around `line_number`, or a diagnostic. */
  const std::string& context() const {
    return context_;
  }

  bool operator==(const Finding& other) const;
  bool operator!=(const Finding& other) const {
    return !(*this == other);
  }

  /* Order by file path, line number, rule name then detail. */
  bool operator<(const Finding& other) const;

  Json::Value to_json() const;

  friend std::ostream& operator<<(std::ostream& out, const Finding& finding);

 private:
  std::filesystem::path file_path_;
  std::size_t line_number_;
  std::string issue_type_;
  std::string matched_code_;
  std::string detail_;
  Severity severity_;
  std::string suggestion_;
  std::string rule_name_;
  std::string context_;
};

} // namespace tracedroid
