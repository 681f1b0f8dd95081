/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/SwallowedExceptionRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_kotlin_catch(R"(\bcatch\s*\(\s*\w+\s*:\s*([\w.]+)\s*\))");

// The first type of a multi-catch is kept.
const re2::RE2 k_java_catch(
    R"(\bcatch\s*\(\s*(?:final\s+)?([\w.]+)(?:\s*\|\s*[\w.]+)*\s+\w+\s*\))");

const std::unordered_set<std::string> k_broad_types = {
    "Throwable",
    "Exception",
    "RuntimeException",
};

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r") == std::string::npos;
}

/**
 * Returns true if the block opened by the first `{` at or after `column` on
 * its first line holds nothing but whitespace. Comments are blanked in the
 * code view, so a block with only comments is empty.
 */
bool is_empty_block(
    const SourceFile& file,
    const scanning::Block& block,
    std::size_t column) {
  const auto& first = file.code(block.start);
  auto open = first.find('{', column);
  if (open == std::string::npos) {
    return false;
  }

  if (block.start == block.end) {
    auto close = first.find('}', open);
    return close != std::string::npos &&
        is_blank(first.substr(open + 1, close - open - 1));
  }

  if (!is_blank(first.substr(open + 1))) {
    return false;
  }
  for (auto line = block.start + 1; line < block.end; line++) {
    if (!is_blank(file.code(line))) {
      return false;
    }
  }
  const auto& last = file.code(block.end);
  return is_blank(last.substr(0, last.find('}')));
}

} // namespace

SwallowedExceptionRule::SwallowedExceptionRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "swallowed-exception",
          /* code */ 3003,
          /* issue_type */ "Swallowed Exception",
          /* suggestion */
          "Log the exception or handle it; an empty catch block hides the failure.",
          /* languages */ {Language::Kotlin, Language::Java}),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> SwallowedExceptionRule::analyze(
    const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  const auto& pattern =
      file.language() == Language::Kotlin ? k_kotlin_catch : k_java_catch;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    auto column = find_column(code, pattern);
    if (!column) {
      continue;
    }
    auto type = *first_capture(code, pattern);

    auto block =
        scanning::find_block(file, line, statement_max_lines_, *column);
    if (!block ||
        !is_empty_block(file, *block, block->start == line ? *column : 0)) {
      continue;
    }

    auto simple_type = type.substr(type.rfind('.') + 1);
    if (k_broad_types.count(simple_type) > 0) {
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          fmt::format(
              "Empty catch block for `{}` silently discards every error.",
              type)));
    } else {
      matches.push_back(match(
          file,
          line,
          Severity::Low,
          fmt::format("Empty catch block for `{}`.", type)));
    }
  }

  return matches;
}

} // namespace tracedroid
