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
#include <trace-droid/rules/UnguardedIoRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_io_operation(
    R"(\b(FileInputStream|FileOutputStream|FileReader|FileWriter|RandomAccessFile|BufferedReader|openFileInput|openFileOutput|openInputStream|openOutputStream)\s*\(|\.\s*(readText|readBytes|readLines)\s*\(|\b(assets\s*\.\s*open|getAssets\s*\(\s*\)\s*\.\s*open)\s*\()");

const re2::RE2 k_use(R"(\.\s*use\s*\{|\.\s*use\s*\()");

const re2::RE2 k_throws(R"(\bthrows\b|@Throws\b)");

// Annotations may sit on the lines before the declaration.
constexpr std::size_t k_annotation_lines = 3;

} // namespace

UnguardedIoRule::UnguardedIoRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "unguarded-io",
          /* code */ 3002,
          /* issue_type */ "Unguarded I/O Operation",
          /* suggestion */
          "Handle `IOException` with a try/catch, and close streams with `use {}` or try-with-resources.",
          /* languages */ {Language::Kotlin, Language::Java}),
      lookback_lines_(heuristics.guard_lookback_lines()),
      lookahead_lines_(heuristics.guard_lookahead_lines()),
      method_search_limit_(heuristics.method_search_limit()) {}

bool UnguardedIoRule::inside_use_block(
    const SourceFile& file,
    std::size_t line_number) const {
  auto first =
      line_number > lookback_lines_ ? line_number - lookback_lines_ : 1;
  for (auto line = first; line < line_number; line++) {
    for (auto column : find_columns(file.code(line), k_use)) {
      auto block = scanning::find_block(file, line, /* max_lines */ 2, column);
      if (block && block->contains(line_number)) {
        return true;
      }
    }
  }
  return false;
}

std::vector<RuleMatch> UnguardedIoRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  auto covered = scanning::try_coverage(file);

  for (std::size_t line = 1; line <= file.size(); line++) {
    if (covered[line]) {
      continue;
    }
    const auto& code = file.code(line);

    std::string constructor;
    std::string read;
    std::string asset;
    if (!re2::RE2::PartialMatch(
            code, k_io_operation, &constructor, &read, &asset)) {
      continue;
    }

    // `stream.bufferedReader().use { ... }`, possibly on the next lines.
    if (scanning::window_contains(
            file, line, /* before */ 0, lookahead_lines_, k_use) ||
        inside_use_block(file, line)) {
      continue;
    }

    if (auto method =
            scanning::find_enclosing_method(file, line, method_search_limit_)) {
      auto first = method->declaration > k_annotation_lines
          ? method->declaration - k_annotation_lines
          : 1;
      auto header_end =
          method->body ? method->body->start : method->declaration;
      if (scanning::block_contains(
              file, scanning::Block{first, header_end}, k_throws)) {
        continue;
      }
    }

    auto operation =
        !constructor.empty() ? constructor : !read.empty() ? read : asset;
    matches.push_back(match(
        file,
        line,
        Severity::Medium,
        fmt::format(
            "`{}` may throw `IOException` and is not inside a try block.",
            operation)));
  }

  return matches;
}

} // namespace tracedroid
