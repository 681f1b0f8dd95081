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
#include <trace-droid/rules/FragmentContextRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_context_access(
    R"(\b(requireContext|requireActivity|requireView)\s*\(\s*\)|\b(getActivity)\s*\(\s*\)\s*\.)");

const re2::RE2 k_attached_guard(
    R"(\bisAdded\b|\bisDetached\b|\bisResumed\b|\bviewLifecycleOwner\b|\b(?:view|context|activity|getView\s*\(\s*\)|getContext\s*\(\s*\)|getActivity\s*\(\s*\))\s*(?:==|!=)\s*null)");

} // namespace

FragmentContextRule::FragmentContextRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "fragment-context",
          /* code */ 5003,
          /* issue_type */ "Unsafe Context Access In Callback",
          /* suggestion */
          "Check `isAdded` (or that the context is not null) before using the fragment's context in an asynchronous callback, or scope the work to `viewLifecycleOwner`.",
          /* languages */ {Language::Kotlin, Language::Java}),
      callback_lookback_lines_(heuristics.callback_lookback_lines()) {}

std::vector<RuleMatch> FragmentContextRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    std::string require;
    std::string get;
    if (!re2::RE2::PartialMatch(
            file.code(line), k_context_access, &require, &get)) {
      continue;
    }
    auto callback =
        enclosing_async_callback(file, line, callback_lookback_lines_);
    if (!callback) {
      continue;
    }
    if (scanning::block_contains(
            file, scanning::Block{callback->start, line}, k_attached_guard)) {
      continue;
    }

    matches.push_back(match(
        file,
        line,
        Severity::High,
        fmt::format(
            "`{}()` is called from an asynchronous callback, when the fragment may be detached.",
            require.empty() ? get : require)));
  }

  return matches;
}

} // namespace tracedroid
