/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <set>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/CollectionAccessRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_index_access(R"((\w+)\s*\[\s*\d+\s*\])");
const re2::RE2 k_get_access(R"((\w+)\s*\.\s*get\s*\(\s*\d+\s*\))");
const re2::RE2 k_first_or_last(R"((\w+)\s*\.\s*(?:first|last)\s*\(\s*\))");

// Java array creation, `new int[4]`.
const re2::RE2 k_array_creation(R"(\bnew\s+[\w.]+\s*\[)");

} // namespace

CollectionAccessRule::CollectionAccessRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "collection-access",
          /* code */ 2000,
          /* issue_type */ "Unsafe Collection Access",
          /* suggestion */
          "Check the size of the collection first, or use `getOrNull`, `firstOrNull` or `lastOrNull`.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      method_search_limit_(heuristics.method_search_limit()) {}

std::vector<RuleMatch> CollectionAccessRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    if (re2::RE2::PartialMatch(code, k_array_creation)) {
      continue;
    }

    std::set<std::string> receivers;
    for (const auto* pattern :
         {&k_index_access, &k_get_access, &k_first_or_last}) {
      for (auto& receiver : all_captures(code, *pattern)) {
        receivers.insert(std::move(receiver));
      }
    }

    for (const auto& receiver : receivers) {
      evaluate_occurrence(file, line, [&]() {
        re2::RE2 guard(fmt::format(
            R"({}\s*(?:\?|!!)?\.\s*(?:isEmpty|isNotEmpty|isNullOrEmpty|orEmpty|size|length|count|indices|lastIndex|getOrNull|getOrElse|firstOrNull|lastOrNull)\b)",
            word(receiver)));
        checked(guard);
        if (scanning::lookback_contains(file, line, lookback_lines_, guard)) {
          return;
        }

        auto severity = Severity::High;
        if (auto method = scanning::find_enclosing_method(
                file, line, method_search_limit_)) {
          if (scanning::method_contains(file, *method, guard)) {
            severity = Severity::Medium;
          }
        }
        matches.push_back(match(
            file,
            line,
            severity,
            fmt::format(
                "`{}` is accessed at a fixed position without checking its size.",
                receiver)));
      });
    }
  }

  return matches;
}

} // namespace tracedroid
