/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string_view>
#include <unordered_set>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/NonNullAssertionRule.h>

namespace tracedroid {

namespace {

// Captures the receiver of `!!`, with its argument list if it is a call.
const re2::RE2 k_assertion(R"((\w+(?:\s*\([^()]*\))?)\s*!!)");

const re2::RE2 k_receiver_name(R"(^(\w+))");

const std::unordered_set<std::string_view> k_framework_getters = {
    "arguments",
    "activity",
    "context",
    "extras",
    "view",
    "getSystemService",
    "findViewById",
    "body",
    "getArguments",
    "getActivity",
    "getContext",
    "getExtras",
    "getParcelableExtra",
    "getStringExtra",
};

} // namespace

NonNullAssertionRule::NonNullAssertionRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "non-null-assertion",
          /* code */ 1001,
          /* issue_type */ "Unsafe Non-Null Assertion",
          /* suggestion */
          "Replace `!!` with a safe call `?.`, an elvis operator `?:` or an explicit null check.",
          /* languages */ {Language::Kotlin}),
      lookback_lines_(heuristics.guard_lookback_lines()) {}

std::vector<RuleMatch> NonNullAssertionRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    if (code.find("!!") == std::string::npos) {
      continue;
    }

    for (const auto& receiver : all_captures(code, k_assertion)) {
      auto name = first_capture(receiver, k_receiver_name);
      if (!name) {
        continue;
      }

      evaluate_occurrence(file, line, [&]() {
        re2::RE2 null_check(fmt::format(
            R"({0}\s*(?:!=|==)\s*null|\bnull\s*(?:!=|==)\s*{0}|{0}\s*\?\.)",
            word(*name)));
        if (scanning::lookback_contains(
                file, line, lookback_lines_, checked(null_check))) {
          matches.push_back(match(
              file,
              line,
              Severity::Low,
              fmt::format(
                  "`{}!!` follows an explicit null check of `{}`.",
                  receiver,
                  *name)));
        } else if (k_framework_getters.count(*name) > 0) {
          matches.push_back(match(
              file,
              line,
              Severity::High,
              fmt::format(
                  "`{}!!` asserts a framework value that is null in common lifecycle states.",
                  receiver)));
        } else {
          matches.push_back(match(
              file,
              line,
              Severity::Medium,
              fmt::format("`{}!!` throws if `{}` is null.", receiver, *name)));
        }
      });
    }
  }

  return matches;
}

} // namespace tracedroid
