/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <unordered_set>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/CursorAccessRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_kotlin_declaration(
    R"(\b(?:val|var)\s+(\w+)(?:\s*:\s*Cursor\??)?\s*=.*\b(?:query|rawQuery)\s*\()");

const re2::RE2 k_kotlin_typed(R"(\b(\w+)\s*:\s*Cursor\b)");

const re2::RE2 k_java_declaration(R"(\bCursor\s+(\w+)\b)");

const re2::RE2 k_accessor(
    R"(\b(\w+)\s*(?:\?|!!)?\.\s*(get(?:String|Int|Long|Double|Float|Short|Blob))\s*\()");

const re2::RE2 k_move(
    R"(\.\s*moveTo(?:First|Next|Position|Last|Previous)\s*\()");

const re2::RE2 k_column_index_argument(
    R"(^\(\s*(?:\w+\s*(?:\?|!!)?\.\s*)?getColumnIndex\s*\()");

} // namespace

CursorAccessRule::CursorAccessRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "cursor-access",
          /* code */ 4002,
          /* issue_type */ "Unchecked Cursor Access",
          /* suggestion */
          "Check the result of `moveToFirst()` / `moveToNext()` before reading, and use `getColumnIndexOrThrow`.",
          /* languages */ {Language::Kotlin, Language::Java}),
      method_search_limit_(heuristics.method_search_limit()),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> CursorAccessRule::analyze(const SourceFile& file) const {
  std::unordered_set<std::string> cursors;
  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    for (const auto* pattern :
         {&k_kotlin_declaration, &k_kotlin_typed, &k_java_declaration}) {
      for (auto& name : all_captures(code, *pattern)) {
        cursors.insert(std::move(name));
      }
    }
  }

  std::vector<RuleMatch> matches;
  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    re2::StringPiece input(code);
    std::string receiver;
    std::string accessor;
    while (re2::RE2::FindAndConsume(&input, k_accessor, &receiver, &accessor)) {
      if (cursors.count(receiver) == 0 &&
          !boost::algorithm::icontains(receiver, "cursor")) {
        continue;
      }
      auto method =
          scanning::find_enclosing_method(file, line, method_search_limit_);
      if (!method) {
        break;
      }

      if (!scanning::method_contains(file, *method, k_move)) {
        matches.push_back(match(
            file,
            line,
            Severity::High,
            fmt::format(
                "`{}.{}` reads from a cursor that is never moved to a row in `{}`.",
                receiver,
                accessor,
                method->name)));
        break;
      }

      auto column = static_cast<std::size_t>(input.data() - code.data());
      auto call = scanning::accumulate_call(
          file, line, column - 1, statement_max_lines_);
      if (call && re2::RE2::PartialMatch(call->code, k_column_index_argument)) {
        matches.push_back(match(
            file,
            line,
            Severity::Medium,
            fmt::format(
                "`{}.{}` is given `getColumnIndex`, which returns -1 for a missing column.",
                receiver,
                accessor)));
        break;
      }
    }
  }

  return matches;
}

} // namespace tracedroid
