/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/CursorLeakRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_kotlin_cursor(
    R"(\b(?:val|var)\s+(\w+)(?:\s*:\s*Cursor\??)?\s*=.*\b(?:query|rawQuery)\s*\()");

const re2::RE2 k_java_cursor(
    R"(\bCursor\s+(\w+)\s*=.*\b(?:query|rawQuery)\s*\()");

const re2::RE2 k_managed(R"(\.\s*use\s*[{(]|\btry\s*\()");

} // namespace

CursorLeakRule::CursorLeakRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "cursor-leak",
          /* code */ 4001,
          /* issue_type */ "Unclosed Cursor",
          /* suggestion */
          "Close the cursor when done, with `use {}` in Kotlin or try-with-resources in Java.",
          /* languages */ {Language::Kotlin, Language::Java}),
      method_search_limit_(heuristics.method_search_limit()) {}

std::vector<RuleMatch> CursorLeakRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  const auto& declaration =
      file.language() == Language::Kotlin ? k_kotlin_cursor : k_java_cursor;

  for (std::size_t line = 1; line <= file.size(); line++) {
    auto cursor = first_capture(file.code(line), declaration);
    if (!cursor) {
      continue;
    }
    auto method =
        scanning::find_enclosing_method(file, line, method_search_limit_);
    if (!method) {
      continue;
    }

    evaluate_occurrence(file, line, [&]() {
      re2::RE2 released(fmt::format(
          R"({0}\s*(?:\?|!!)?\.\s*close\s*\(|\breturn\s+{0}\b)",
          word(*cursor)));
      if (scanning::method_contains(file, *method, checked(released)) ||
          scanning::method_contains(file, *method, k_managed)) {
        return;
      }

      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "Cursor `{}` is never closed in `{}`.", *cursor, method->name)));
    });
  }

  return matches;
}

} // namespace tracedroid
