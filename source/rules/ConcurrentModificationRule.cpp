/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <set>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/ConcurrentModificationRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_kotlin_for(
    R"(\bfor\s*\(\s*(?:\([^()]*\)|\w+)(?:\s*:\s*[\w.<>?]+)?\s+in\s+(?:this\s*\.\s*)?(\w+)\s*\))");

const re2::RE2 k_java_for_each(
    R"(\bfor\s*\(\s*(?:final\s+)?[\w.<>\[\], ?]+\s+\w+\s*:\s*(?:this\s*\.\s*)?(\w+)\s*\))");

const re2::RE2 k_for_each_call(R"(\b(\w+)\s*\.\s*forEach\s*[({])");

const re2::RE2 k_opening_brace(R"(^\s*\{)");

const re2::RE2 k_loop_exit(R"(\b(?:break|return)\b)");

} // namespace

ConcurrentModificationRule::ConcurrentModificationRule(
    const Heuristics& heuristics)
    : Rule(
          /* name */ "concurrent-modification",
          /* code */ 2002,
          /* issue_type */ "Concurrent Modification",
          /* suggestion */
          "Do not modify a collection while iterating over it. Iterate over a copy, use an iterator's `remove`, or collect the changes and apply them after the loop.",
          /* languages */ {Language::Kotlin, Language::Java}),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> ConcurrentModificationRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  std::set<std::size_t> reported;

  auto check_body = [&](const scanning::Block& body,
                        const std::string& collection,
                        std::size_t header) {
    evaluate_occurrence(file, header, [&]() {
      re2::RE2 modification(fmt::format(
          R"({}\s*\.\s*(add|addAll|remove|removeAll|removeAt|removeIf|clear|retainAll)\s*\()",
          word(collection)));
      checked(modification);

      for (auto line = body.start; line <= body.end && line <= file.size();
           line++) {
        const auto& code = file.code(line);
        auto operation = first_capture(code, modification);
        if (!operation) {
          continue;
        }
        if (re2::RE2::PartialMatch(code, k_loop_exit) ||
            (file.has_line_number(line + 1) &&
             re2::RE2::PartialMatch(file.code(line + 1), k_loop_exit))) {
          continue;
        }
        if (!reported.insert(line).second) {
          continue;
        }
        matches.push_back(match(
            file,
            line,
            Severity::High,
            fmt::format(
                "`{}.{}` is called while iterating over `{}` (loop at line {}).",
                collection,
                *operation,
                collection,
                header)));
      }
    });
  };

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    // `for` loops: the body must open right after the header.
    for (const auto* pattern : {&k_kotlin_for, &k_java_for_each}) {
      re2::StringPiece input(code);
      re2::StringPiece header;
      std::string collection;
      if (!pattern->Match(
              input, 0, input.size(), re2::RE2::UNANCHORED, &header, 1) ||
          !re2::RE2::PartialMatch(code, *pattern, &collection)) {
        continue;
      }
      auto column = static_cast<std::size_t>(header.data() - input.data()) +
          header.size();
      auto rest = code.substr(column);
      bool braced = re2::RE2::PartialMatch(rest, k_opening_brace) ||
          (rest.find_first_not_of(" \t") == std::string::npos &&
           file.has_line_number(line + 1) &&
           re2::RE2::PartialMatch(file.code(line + 1), k_opening_brace));
      if (!braced) {
        continue;
      }
      if (auto body =
              scanning::find_block(file, line, statement_max_lines_, column)) {
        check_body(*body, collection, line);
      }
    }

    for (auto column : find_columns(code, k_for_each_call)) {
      auto collection = first_capture(code.substr(column), k_for_each_call);
      auto body = scanning::find_block(file, line, /* max_lines */ 2, column);
      if (collection && body && body->start == line) {
        check_body(*body, *collection, line);
      }
    }
  }

  return matches;
}

} // namespace tracedroid
