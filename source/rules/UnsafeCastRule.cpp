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
#include <trace-droid/rules/UnsafeCastRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_import(R"(^\s*(?:import|package)\b)");

// `as T` but not `as? T`.
const re2::RE2 k_kotlin_cast(R"(\bas\s+([A-Z][\w.]*))");

const re2::RE2 k_java_cast(
    R"(\(\s*([A-Z][\w.]*)(?:<[^<>()]*>)?\s*\)\s*(?:\w+\s*(?:\([^()]*\))?\s*\.\s*)*(?:getSystemService|getParcelable\w*|getSerializable\w*|findViewById)\s*\()");

} // namespace

UnsafeCastRule::UnsafeCastRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "unsafe-cast",
          /* code */ 1003,
          /* issue_type */ "Unsafe Type Cast",
          /* suggestion */
          "Use a safe cast (`as?` in Kotlin) or check the type with `is` / `instanceof` before casting.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()) {}

std::vector<RuleMatch> UnsafeCastRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  bool kotlin = file.language() == Language::Kotlin;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    if (re2::RE2::PartialMatch(code, k_import)) {
      continue;
    }

    auto type = first_capture(code, kotlin ? k_kotlin_cast : k_java_cast);
    if (!type) {
      continue;
    }

    evaluate_occurrence(file, line, [&]() {
      re2::RE2 type_check(fmt::format(
          R"(\b{}\s+{}\b)",
          kotlin ? "is" : "instanceof",
          re2::RE2::QuoteMeta(*type)));
      if (scanning::lookback_contains(
              file, line, lookback_lines_, checked(type_check))) {
        matches.push_back(match(
            file,
            line,
            Severity::Low,
            fmt::format("Cast to `{}` follows a type check.", *type)));
      } else {
        matches.push_back(match(
            file,
            line,
            Severity::Medium,
            fmt::format(
                "Cast to `{}` throws `ClassCastException` if the value has another type.",
                *type)));
      }
    });
  }

  return matches;
}

} // namespace tracedroid
