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
#include <trace-droid/rules/ResponseBodyRule.h>

namespace tracedroid {

namespace {

// `response.body().x` and `response.body()!!.x`, not `response.body()?.x`.
const re2::RE2 k_body_dereference(
    R"(\b(\w+)\s*\.\s*body\s*\(\s*\)\s*(?:!!)?\s*\.\s*\w)");

const re2::RE2 k_response_check(
    R"(\bisSuccessful\b|\bcode\s*\(\s*\)|\bbody\s*\(\s*\)\s*(?:==|!=)\s*null|\bbody\s*\(\s*\)\s*\?\.\s*let\b)");

} // namespace

ResponseBodyRule::ResponseBodyRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "response-body",
          /* code */ 6000,
          /* issue_type */ "Unchecked API Response",
          /* suggestion */
          "Check `response.isSuccessful` and handle a null body before using it.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()) {}

bool ResponseBodyRule::applies_to(const SourceFile& file) const {
  return Rule::applies_to(file) && file.has_path_segment("peertube");
}

std::vector<RuleMatch> ResponseBodyRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    auto response = first_capture(file.code(line), k_body_dereference);
    if (!response) {
      continue;
    }
    evaluate_occurrence(file, line, [&]() {
      re2::RE2 null_check(fmt::format(
          R"({}\s*(?:==|!=)\s*null)", word(*response)));
      if (scanning::lookback_contains(
              file, line, lookback_lines_, k_response_check) ||
          scanning::lookback_contains(
              file, line, lookback_lines_, checked(null_check))) {
        return;
      }

      matches.push_back(match(
          file,
          line,
          Severity::High,
          fmt::format(
              "The body of `{}` is used without checking that the request succeeded.",
              *response)));
    });
  }

  return matches;
}

} // namespace tracedroid
