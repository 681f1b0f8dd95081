/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <memory>
#include <set>
#include <utility>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/AndroidPatterns.h>
#include <trace-droid/rules/LateinitAccessRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_lateinit(R"(\blateinit\s+var\s+(\w+))");

struct Lateinit {
  std::string name;
  // Reads of the variable, excluding assignments.
  std::unique_ptr<re2::RE2> use;
  std::unique_ptr<re2::RE2> initialized_check;
};

} // namespace

LateinitAccessRule::LateinitAccessRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "lateinit-access",
          /* code */ 1002,
          /* issue_type */ "Uninitialized Lateinit Access",
          /* suggestion */
          "Check `::property.isInitialized` before using a `lateinit` property in teardown callbacks, or make it nullable.",
          /* languages */ {Language::Kotlin}),
      method_search_limit_(heuristics.method_search_limit()) {}

std::vector<RuleMatch> LateinitAccessRule::analyze(
    const SourceFile& file) const {
  std::vector<Lateinit> variables;
  for (std::size_t line = 1; line <= file.size(); line++) {
    for (const auto& name : all_captures(file.code(line), k_lateinit)) {
      evaluate_occurrence(file, line, [&]() {
        auto use = std::make_unique<re2::RE2>(fmt::format(
            R"((?:^|[^\w.:]|\bthis\.){}\b(?:\s*[^\s=]|\s*==|$))", name));
        auto initialized_check = std::make_unique<re2::RE2>(
            fmt::format(R"(::{}\s*\.\s*isInitialized\b)", name));
        checked(*use);
        checked(*initialized_check);
        variables.push_back(
            Lateinit{name, std::move(use), std::move(initialized_check)});
      });
    }
  }
  if (variables.empty()) {
    return {};
  }

  std::vector<RuleMatch> matches;
  auto methods = scanning::method_names(file);
  // (method declaration, variable) pairs already reported.
  std::set<std::pair<std::size_t, std::string>> reported;

  for (std::size_t line = 1; line <= file.size(); line++) {
    if (!is_teardown_method(methods[line])) {
      continue;
    }
    const auto& code = file.code(line);

    for (const auto& variable : variables) {
      if (!re2::RE2::PartialMatch(code, *variable.use) ||
          re2::RE2::PartialMatch(code, *variable.initialized_check)) {
        continue;
      }
      auto method =
          scanning::find_enclosing_method(file, line, method_search_limit_);
      if (!method) {
        continue;
      }
      if (scanning::method_contains(
              file, *method, *variable.initialized_check)) {
        continue;
      }
      if (!reported.emplace(method->declaration, variable.name).second) {
        continue;
      }
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "`lateinit` property `{}` is used in `{}` without an `isInitialized` check.",
              variable.name,
              method->name)));
    }
  }

  return matches;
}

} // namespace tracedroid
