/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <json/json.h>

#include <trace-droid/Errors.h>
#include <trace-droid/Severity.h>
#include <trace-droid/SourceFile.h>

namespace tracedroid {

/* One occurrence reported by a rule, before the engine turns it into a
 * `Finding`. */
struct RuleMatch {
  std::size_t line_number;
  std::string matched_code;
  std::string detail;
  Severity severity;
};

/**
 * A heuristic detector for one class of defect.
 *
 * Rules are immutable once constructed: every pattern and window size is
 * fixed by the constructor. `analyze` may keep state on its stack while it
 * scans a file, but nothing survives the call, so a rule can analyze several
 * files concurrently.
 */
class Rule {
 public:
  Rule(
      const std::string& name,
      int code,
      const std::string& issue_type,
      const std::string& suggestion,
      std::vector<Language> languages)
      : name_(name),
        code_(code),
        issue_type_(issue_type),
        suggestion_(suggestion),
        languages_(std::move(languages)) {}
  Rule(const Rule&) = delete;
  Rule(Rule&&) = delete;
  Rule& operator=(const Rule&) = delete;
  Rule& operator=(Rule&&) = delete;
  virtual ~Rule() = default;

  const std::string& name() const {
    return name_;
  }

  int code() const {
    return code_;
  }

  const std::string& issue_type() const {
    return issue_type_;
  }

  const std::string& suggestion() const {
    return suggestion_;
  }

  const std::vector<Language>& languages() const {
    return languages_;
  }

  /**
   * Whether the rule should look at the given file at all. By default, this
   * checks the language of the file.
   */
  virtual bool applies_to(const SourceFile& file) const;

  /**
   * Analyze the whole file. Occurrences that cannot be resolved (no enclosing
   * method, unbalanced parentheses, ...) are skipped.
   */
  virtual std::vector<RuleMatch> analyze(const SourceFile& file) const = 0;

  Json::Value to_json() const;

 protected:
  /* Build a match for the given line, reporting its trimmed raw text. */
  static RuleMatch match(
      const SourceFile& file,
      std::size_t line_number,
      Severity severity,
      std::string detail);

  /**
   * Evaluate the occurrence at `line_number`. If `evaluate` raises a
   * `RuleEvaluationError`, that occurrence is skipped and the rest of the
   * file is still analyzed.
   */
  template <typename Evaluate>
  void evaluate_occurrence(
      const SourceFile& file,
      std::size_t line_number,
      const Evaluate& evaluate) const {
    try {
      evaluate();
    } catch (const RuleEvaluationError& error) {
      skip_occurrence(file, line_number, error);
    }
  }

 private:
  void skip_occurrence(
      const SourceFile& file,
      std::size_t line_number,
      const RuleEvaluationError& error) const;

  std::string name_;
  int code_;
  std::string issue_type_;
  std::string suggestion_;
  std::vector<Language> languages_;
};

} // namespace tracedroid
