/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/SplitIndexRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_split(R"(\.\s*split\s*\()");

const re2::RE2 k_index(
    R"(^\s*(?:!!)?\s*(?:\[\s*(\d{1,9})\s*\]|\.\s*get\s*\(\s*(\d{1,9})\s*\)))");

const re2::RE2 k_size_check(
    R"(\.\s*(?:size|length|count|lastIndex|indices)\b|\bgetOrNull\b|\bgetOrElse\b|\blimit\s*=)");

} // namespace

SplitIndexRule::SplitIndexRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "split-index",
          /* code */ 2001,
          /* issue_type */ "Unchecked Split Result",
          /* suggestion */
          "Check the number of parts returned by `split` before indexing, or use `getOrNull`.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> SplitIndexRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    for (auto column : find_columns(file.code(line), k_split)) {
      auto call =
          scanning::accumulate_call(file, line, column, statement_max_lines_);
      if (!call) {
        continue;
      }

      std::string bracket_index;
      std::string get_index;
      if (!re2::RE2::PartialMatch(
              file.code(call->end).substr(call->end_column + 1),
              k_index,
              &bracket_index,
              &get_index)) {
        continue;
      }
      auto index =
          std::stoul(bracket_index.empty() ? get_index : bracket_index);
      if (index == 0) {
        continue;
      }
      if (scanning::window_contains(
              file, call->end, lookback_lines_, /* after */ 0, k_size_check)) {
        continue;
      }

      matches.push_back(match(
          file,
          line,
          Severity::High,
          fmt::format(
              "Part {} of a `split` result is read without checking how many parts there are.",
              index)));
      break;
    }
  }

  return matches;
}

} // namespace tracedroid
