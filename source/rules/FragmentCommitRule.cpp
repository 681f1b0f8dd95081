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
#include <trace-droid/rules/AndroidPatterns.h>
#include <trace-droid/rules/FragmentCommitRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_commit(R"(\.\s*(commit|commitNow)\s*\(\s*\))");

const re2::RE2 k_transaction(
    R"(\bbeginTransaction\b|FragmentManager\b|\bfragmentManager\b|\bFragmentTransaction\b|\baddToBackStack\b|\.\s*replace\s*\(\s*R\s*\.\s*id\b)");

const re2::RE2 k_preferences(
    R"(\bedit\s*\(\s*\)|SharedPreferences\b|\bprefs?\b|\bpreferences\b)");

const re2::RE2 k_state_guard(R"(\bisStateSaved\b|\bcommitAllowingStateLoss\b)");

// A transaction chain usually spans a few lines before `.commit()`.
constexpr std::size_t k_transaction_lines = 5;

} // namespace

FragmentCommitRule::FragmentCommitRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "fragment-commit",
          /* code */ 5005,
          /* issue_type */ "Fragment Commit After State Save",
          /* suggestion */
          "Check `isStateSaved` before committing a transaction from an asynchronous callback, or use `commitAllowingStateLoss` if losing it is acceptable.",
          /* languages */ {Language::Kotlin, Language::Java}),
      callback_lookback_lines_(heuristics.callback_lookback_lines()) {}

std::vector<RuleMatch> FragmentCommitRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    auto commit = first_capture(code, k_commit);
    if (!commit || re2::RE2::PartialMatch(code, k_preferences) ||
        !scanning::lookback_contains(
            file, line, k_transaction_lines, k_transaction)) {
      continue;
    }

    auto callback =
        enclosing_async_callback(file, line, callback_lookback_lines_);
    if (!callback ||
        scanning::block_contains(
            file, scanning::Block{callback->start, line}, k_state_guard)) {
      continue;
    }

    matches.push_back(match(
        file,
        line,
        Severity::Medium,
        fmt::format(
            "`{}()` runs in an asynchronous callback and throws if the activity state was already saved.",
            *commit)));
  }

  return matches;
}

} // namespace tracedroid
