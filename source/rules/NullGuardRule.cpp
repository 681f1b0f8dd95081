/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <map>
#include <memory>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/NullGuardRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_nullable_declaration(
    R"(\b(?:val|var)\s+(\w+)\s*:\s*[\w.<>, ]+\?\s*(?:=|$))");

const re2::RE2 k_declaration(R"(\b(?:val|var)\s+(\w+)\b)");

const re2::RE2 k_early_exit(R"(\b(?:return|throw|continue|break)\b)");

} // namespace

NullGuardRule::NullGuardRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "null-guard",
          /* code */ 1000,
          /* issue_type */ "Missing Null Guard",
          /* suggestion */
          "Check the value for null before dereferencing it, or use the safe call operator `?.`.",
          /* languages */ {Language::Kotlin}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      method_search_limit_(heuristics.method_search_limit()) {}

bool NullGuardRule::guarded(
    const SourceFile& file,
    std::size_t first_line,
    std::size_t last_line,
    const std::string& variable) const {
  auto name = word(variable);
  re2::RE2 guard(fmt::format(
      R"({0}\s*!=\s*null|\bnull\s*!=\s*{0}|{0}\s*\?\.\s*(?:let|also|run)\b|\bif\s*\(\s*{0}\s+is\b|(?:requireNotNull|checkNotNull)\s*\(\s*{0}|{0}\s*\?:\s*(?:return|throw))",
      name));
  re2::RE2 null_comparison(fmt::format(R"({0}\s*==\s*null|\bnull\s*==\s*{0})", name));
  re2::RE2 assignment(fmt::format(R"({0}\s*=\s*(\w+))", name));
  checked(guard);
  checked(null_comparison);
  checked(assignment);

  for (auto line = first_line; line <= last_line; line++) {
    const auto& code = file.code(line);
    if (re2::RE2::PartialMatch(code, guard)) {
      return true;
    }
    // `if (x == null) return` on one line or two.
    if (re2::RE2::PartialMatch(code, null_comparison) &&
        (re2::RE2::PartialMatch(code, k_early_exit) ||
         (file.has_line_number(line + 1) &&
          re2::RE2::PartialMatch(file.code(line + 1), k_early_exit)))) {
      return true;
    }
    // Assigned a non-null value.
    std::string value;
    if (re2::RE2::PartialMatch(code, assignment, &value) && value != "null") {
      return true;
    }
  }
  return false;
}

std::vector<RuleMatch> NullGuardRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;

  struct Nullable {
    std::size_t declaration_line;
    std::unique_ptr<re2::RE2> dereference;
  };
  // Nullable variables in scope, by name.
  std::map<std::string, Nullable> nullables;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    std::string declared;
    if (re2::RE2::PartialMatch(code, k_nullable_declaration, &declared)) {
      evaluate_occurrence(file, line, [&]() {
        auto dereference = std::make_unique<re2::RE2>(
            fmt::format(R"((?:^|[^\w.?]|\bthis\.){}\.\w)", declared));
        checked(*dereference);
        nullables[declared] = Nullable{line, std::move(dereference)};
      });
      continue;
    }
    if (re2::RE2::PartialMatch(code, k_declaration, &declared)) {
      // Redeclared as non-null.
      nullables.erase(declared);
    }

    for (const auto& entry : nullables) {
      const auto& variable = entry.first;
      if (!re2::RE2::PartialMatch(code, *entry.second.dereference)) {
        continue;
      }
      evaluate_occurrence(file, line, [&]() {
        auto declaration_line = entry.second.declaration_line;

        auto first = std::max(
            declaration_line + 1,
            line > lookback_lines_ ? line - lookback_lines_ : 1);
        if (guarded(file, first, line, variable)) {
          return;
        }

        auto severity = Severity::High;
        if (auto method = scanning::find_enclosing_method(
                file, line, method_search_limit_)) {
          if (guarded(file, method->declaration, method->end, variable)) {
            severity = Severity::Medium;
          }
        }
        matches.push_back(match(
            file,
            line,
            severity,
            fmt::format(
                "`{}` is declared nullable at line {} and dereferenced without a null check.",
                variable,
                declaration_line)));
      });
    }
  }

  return matches;
}

} // namespace tracedroid
