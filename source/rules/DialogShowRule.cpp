/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/rules/AndroidPatterns.h>
#include <trace-droid/rules/DialogShowRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_show(R"(\.\s*show\s*\(\s*\))");

const re2::RE2 k_dialog(R"((?i)\w*(?:dialog|builder)\b)");

const re2::RE2 k_transient(R"(\bToast\b|\bSnackbar\b)");

const re2::RE2 k_lifecycle_guard(
    R"(\bisFinishing\b|\bisDestroyed\b|\bisAdded\b|\bisResumed\b|\blifecycle\s*\.\s*currentState\b)");

// Builder chains usually span a few lines before `.show()`.
constexpr std::size_t k_builder_lines = 3;

} // namespace

DialogShowRule::DialogShowRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "dialog-show",
          /* code */ 5004,
          /* issue_type */ "Unsafe Dialog Display",
          /* suggestion */
          "Check `isFinishing` / `isDestroyed` (or `isAdded` in a fragment) before showing a dialog from an asynchronous callback.",
          /* languages */ {Language::Kotlin, Language::Java}),
      callback_lookback_lines_(heuristics.callback_lookback_lines()) {}

std::vector<RuleMatch> DialogShowRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    if (!re2::RE2::PartialMatch(code, k_show)) {
      continue;
    }
    bool dialog = re2::RE2::PartialMatch(code, k_dialog) ||
        (!scanning::lookback_contains(
             file, line, k_builder_lines, k_transient) &&
         scanning::lookback_contains(file, line, k_builder_lines, k_dialog));
    if (!dialog) {
      continue;
    }

    auto callback =
        enclosing_async_callback(file, line, callback_lookback_lines_);
    if (!callback ||
        scanning::block_contains(
            file, scanning::Block{callback->start, line}, k_lifecycle_guard)) {
      continue;
    }

    matches.push_back(match(
        file,
        line,
        Severity::Medium,
        "A dialog is shown from an asynchronous callback without checking that the screen is still alive."));
  }

  return matches;
}

} // namespace tracedroid
