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
#include <trace-droid/rules/IntentExtraRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_extra_lookup(
    R"(\b(get\w*Extras?)\s*\(|\bextras\s*\.\s*(get\w*)\s*\()");

// Kotlin `intent.extras.getString(...)` is a dereference of `extras`.
const re2::RE2 k_extras_dereference(
    R"(\b(?:intent|getIntent\s*\(\s*\))\s*\.\s*(?:extras|getExtras\s*\(\s*\))\s*\.\s*\w)");

const re2::RE2 k_dereference(R"(^\s*\.\s*\w)");

const re2::RE2 k_guard(
    R"(\bhasExtra\s*\(|\bcontainsKey\s*\(|(?:!=|==)\s*null\b|\bnull\s*(?:!=|==)|\?\.\s*let\b|\bisNullOrEmpty\b)");

} // namespace

IntentExtraRule::IntentExtraRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "intent-extra",
          /* code */ 1004,
          /* issue_type */ "Unchecked Intent Extra",
          /* suggestion */
          "Check `hasExtra` or handle a null result before using values read from an intent or bundle.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> IntentExtraRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  auto report = [&](std::size_t line, const std::string& lookup) {
    bool guarded =
        scanning::lookback_contains(file, line, lookback_lines_, k_guard);
    if (guarded) {
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "Result of `{}` is dereferenced directly; the nearby check may not cover this lookup.",
              lookup)));
    } else {
      matches.push_back(match(
          file,
          line,
          Severity::High,
          fmt::format(
              "Result of `{}` is dereferenced without checking that the extra exists.",
              lookup)));
    }
  };

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    if (re2::RE2::PartialMatch(code, k_extras_dereference)) {
      report(line, "extras");
      continue;
    }

    for (auto column : find_columns(code, k_extra_lookup)) {
      auto call =
          scanning::accumulate_call(file, line, column, statement_max_lines_);
      if (!call) {
        continue;
      }
      auto rest = file.code(call->end).substr(call->end_column + 1);
      if (!re2::RE2::PartialMatch(rest, k_dereference)) {
        continue;
      }
      std::string method;
      std::string property_method;
      if (!re2::RE2::PartialMatch(
              code.substr(column), k_extra_lookup, &method, &property_method)) {
        continue;
      }
      report(line, method.empty() ? property_method : method);
      break;
    }
  }

  return matches;
}

} // namespace tracedroid
