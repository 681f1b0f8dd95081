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
#include <trace-droid/rules/GlobalScopeRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_global_scope(R"(\bGlobalScope\s*\.\s*(launch|async)\b)");
const re2::RE2 k_run_blocking(R"(\brunBlocking\b)");

} // namespace

GlobalScopeRule::GlobalScopeRule(const Heuristics& /* heuristics */)
    : Rule(
          /* name */ "global-scope",
          /* code */ 5006,
          /* issue_type */ "Unscoped Coroutine",
          /* suggestion */
          "Launch coroutines in `lifecycleScope` or `viewModelScope`, and never block the main thread with `runBlocking`.",
          /* languages */ {Language::Kotlin}) {}

std::vector<RuleMatch> GlobalScopeRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  auto methods = scanning::method_names(file);

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    if (auto builder = first_capture(code, k_global_scope)) {
      matches.push_back(match(
          file,
          line,
          Severity::Low,
          fmt::format(
              "`GlobalScope.{}` outlives the component that started it.",
              *builder)));
    } else if (
        re2::RE2::PartialMatch(code, k_run_blocking) &&
        is_main_thread_method(methods[line])) {
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "`runBlocking` blocks the main thread in `{}`.", methods[line])));
    }
  }

  return matches;
}

} // namespace tracedroid
