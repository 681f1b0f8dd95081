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
#include <trace-droid/rules/NumberFormatRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_java_parse(
    R"(\b((?:Integer|Long|Double|Float|Short|Byte)\s*\.\s*parse\w+)\s*\()");

// Kotlin conversions, only on receivers that look like strings.
const re2::RE2 k_kotlin_conversion(
    R"((?:"|\btext\b|\bString\b|\w*(?:[Ss]tr|[Tt]ext|[Ii]nput|[Pp]aram|[Aa]rg|[Vv]alue|[Ee]xtra)\w*|\btoString\s*\(\s*\)|\btrim\s*\(\s*\)|\bgetString\w*\s*\([^()]*\)|\breadLine\s*\(\s*\))\s*(?:!!)?\s*\.\s*(to(?:Int|Long|Double|Float|Short|Byte))\s*\(\s*\))");

const re2::RE2 k_numeric_literal_argument(
    R"(^\(\s*"-?\d+(?:\.\d+)?"\s*(?:,\s*\d+\s*)?\)$)");

const re2::RE2 k_numeric_literal_receiver(
    R"("-?\d+(?:\.\d+)?"\s*\.\s*to(?:Int|Long|Double|Float|Short|Byte)\s*\()");

const re2::RE2 k_try(R"(\btry\b|\brunCatching\b)");

} // namespace

NumberFormatRule::NumberFormatRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "number-format",
          /* code */ 3000,
          /* issue_type */ "Unguarded Number Parsing",
          /* suggestion */
          "Catch `NumberFormatException`, or use `toIntOrNull()` and friends and handle the null case.",
          /* languages */ {Language::Kotlin, Language::Java}),
      method_search_limit_(heuristics.method_search_limit()),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> NumberFormatRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  auto covered = scanning::try_coverage(file);

  for (std::size_t line = 1; line <= file.size(); line++) {
    if (covered[line]) {
      continue;
    }
    const auto& code = file.code(line);

    std::string conversion;
    bool literal = false;
    if (auto column = find_column(code, k_java_parse)) {
      conversion = *first_capture(code, k_java_parse);
      if (auto call = scanning::accumulate_call(
              file, line, *column, statement_max_lines_)) {
        literal =
            re2::RE2::FullMatch(call->text, k_numeric_literal_argument);
      }
    } else if (auto kotlin = first_capture(code, k_kotlin_conversion)) {
      conversion = *kotlin;
      literal = re2::RE2::PartialMatch(
          file.line(line), k_numeric_literal_receiver);
    } else {
      continue;
    }

    auto severity = Severity::High;
    if (literal) {
      severity = Severity::Medium;
    } else if (auto method = scanning::find_enclosing_method(
                   file, line, method_search_limit_)) {
      if (scanning::method_contains(file, *method, k_try)) {
        severity = Severity::Medium;
      }
    }
    matches.push_back(match(
        file,
        line,
        severity,
        fmt::format(
            "`{}` throws `NumberFormatException` on malformed input and is not inside a try block.",
            conversion)));
  }

  return matches;
}

} // namespace tracedroid
