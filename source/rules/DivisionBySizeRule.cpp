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
#include <trace-droid/rules/DivisionBySizeRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_division(
    R"([/%]=?\s*(\w+)\s*(?:\?|!!)?\.\s*(?:size|length|count)\b(?:\s*\(\s*\))?)");

// A divisor clamped on the same line, `xs.size.coerceAtLeast(1)`.
const re2::RE2 k_clamp(R"(\bcoerceAtLeast\s*\(|\bmaxOf\s*\(|\bMath\s*\.\s*max\s*\()");

} // namespace

DivisionBySizeRule::DivisionBySizeRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "division-by-size",
          /* code */ 2003,
          /* issue_type */ "Possible Division By Zero",
          /* suggestion */
          "Check that the collection is not empty before dividing by its size.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()) {}

std::vector<RuleMatch> DivisionBySizeRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    auto receiver = first_capture(code, k_division);
    if (!receiver || re2::RE2::PartialMatch(code, k_clamp)) {
      continue;
    }

    evaluate_occurrence(file, line, [&]() {
      auto name = word(*receiver);
      re2::RE2 guard(fmt::format(
          R"({0}\s*(?:\?|!!)?\.\s*(?:isEmpty|isNotEmpty|isNullOrEmpty)\b|{0}\s*(?:\?|!!)?\.\s*(?:size|length|count)(?:\s*\(\s*\))?\s*(?:[<>]=?|==|!=)|(?:[<>]=?|==|!=)\s*{0}\s*(?:\?|!!)?\.\s*(?:size|length|count)\b)",
          name));
      if (scanning::lookback_contains(
              file, line, lookback_lines_, checked(guard))) {
        return;
      }

      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "Division by the size of `{}`, which may be empty.", *receiver)));
    });
  }

  return matches;
}

} // namespace tracedroid
