/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <optional>
#include <string>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/SqlInjectionRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_sql_call(
    R"(\b(rawQuery|execSQL|query|compileStatement)\s*\()");

// On the code view, where literals keep their quotes.
const re2::RE2 k_concatenation(R"("\s*\+\s*[\w(]|[\w)]\s*\+\s*")");

// On the raw text.
const re2::RE2 k_template(R"("[^"]*\$(?:\{|[A-Za-z_]))");

const re2::RE2 k_format(R"(\bString\s*\.\s*format\s*\(|\.\s*format\s*\()");

const re2::RE2 k_selection_arguments(
    R"(\barrayOf\s*\(|\bnew\s+String\s*\[\s*\]|\w*Args\b)");

const re2::RE2 k_first_argument(R"(^\(\s*(\w+)\s*[,)])");

} // namespace

SqlInjectionRule::SqlInjectionRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "sql-injection",
          /* code */ 4000,
          /* issue_type */ "Unsafe SQL Construction",
          /* suggestion */
          "Use `?` placeholders with selection arguments instead of building SQL from strings.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> SqlInjectionRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    for (auto column : find_columns(code, k_sql_call)) {
      auto call =
          scanning::accumulate_call(file, line, column, statement_max_lines_);
      if (!call) {
        continue;
      }
      evaluate_occurrence(file, line, [&]() {
        auto method = *first_capture(code.substr(column), k_sql_call);

        std::optional<std::string> reason;
        if (re2::RE2::PartialMatch(call->code, k_concatenation)) {
          reason = "string concatenation";
        } else if (re2::RE2::PartialMatch(call->text, k_template)) {
          reason = "a string template";
        } else if (re2::RE2::PartialMatch(call->code, k_format)) {
          reason = "`format`";
        } else if (
            auto argument = first_capture(call->code, k_first_argument)) {
          // The query is a variable that was built by concatenation.
          re2::RE2 built(fmt::format(
              R"({}\s*\+?=\s*.*(?:"\s*\+\s*[\w(]|[\w)]\s*\+\s*"))",
              word(*argument)));
          auto first = line > lookback_lines_ ? line - lookback_lines_ : 1;
          for (auto previous = line; previous-- > first;) {
            if (re2::RE2::PartialMatch(file.code(previous), checked(built))) {
              reason = fmt::format(
                  "`{}`, built by concatenation at line {}",
                  *argument,
                  previous);
              break;
            }
          }
        }
        if (!reason) {
          return;
        }

        bool parameterized =
            re2::RE2::PartialMatch(call->code, k_selection_arguments);
        matches.push_back(match(
            file,
            line,
            parameterized ? Severity::Medium : Severity::High,
            fmt::format(
                "SQL passed to `{}` is built with {}.", method, *reason)));
      });
    }
  }

  return matches;
}

} // namespace tracedroid
