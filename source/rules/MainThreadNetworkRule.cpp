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
#include <trace-droid/rules/MainThreadNetworkRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_network_call(
    R"((\bopenConnection\s*\(|\bHttpURLConnection\b|\.\s*execute\s*\(\s*\)|\bURL\s*\([^()]*\)\s*\.\s*readText\s*\())");

const re2::RE2 k_background(
    R"(\bThread\b|\bthread\s*[({]|\blaunch\b|\basync\b|\bwithContext\b|\b\w*Executor\w*\b|\bexecutor\b|\benqueue\b|\bDispatchers\s*\.\s*IO\b|\bAsyncTask\b|\bdoInBackground\b)");

} // namespace

MainThreadNetworkRule::MainThreadNetworkRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "main-thread-network",
          /* code */ 5002,
          /* issue_type */ "Network On Main Thread",
          /* suggestion */
          "Move network calls off the main thread, with coroutines on `Dispatchers.IO`, an executor, or an asynchronous call.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()) {}

std::vector<RuleMatch> MainThreadNetworkRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  auto methods = scanning::method_names(file);

  for (std::size_t line = 1; line <= file.size(); line++) {
    if (!is_main_thread_method(methods[line])) {
      continue;
    }
    auto call = first_capture(file.code(line), k_network_call);
    if (!call) {
      continue;
    }
    if (scanning::lookback_contains(
            file, line, lookback_lines_, k_background)) {
      continue;
    }

    matches.push_back(match(
        file,
        line,
        Severity::High,
        fmt::format(
            "`{}` runs on the main thread in `{}`.", *call, methods[line])));
  }

  return matches;
}

} // namespace tracedroid
