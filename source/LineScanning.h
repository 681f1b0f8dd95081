/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <re2/re2.h>

#include <trace-droid/SourceFile.h>

namespace tracedroid {
namespace scanning {

/* Lines of an opening brace and of its matching closing brace. */
struct Block {
  std::size_t start;
  std::size_t end;

  bool contains(std::size_t line_number) const {
    return line_number >= start && line_number <= end;
  }
};

/* A call expression, possibly spread over several lines. */
struct Statement {
  std::size_t start;
  std::size_t end;
  // Column of the closing parenthesis on the `end` line.
  std::size_t end_column;
  // Raw text from the opening parenthesis to the matching one.
  std::string text;
  // Same as `text`, with comments and literal contents blanked.
  std::string code;
};

struct Method {
  std::string name;
  // Line of the declaration.
  std::size_t declaration;
  // Last line of the body. For expression-bodied functions, the last line of
  // the expression.
  std::size_t end;
  // The brace-delimited body, absent for expression-bodied functions.
  std::optional<Block> body;

  bool contains(std::size_t line_number) const {
    return line_number >= declaration && line_number <= end;
  }
};

/**
 * Starting from the first `{` found at or after (`line_number`, `column`),
 * within `max_lines` lines, count braces forward until the depth returns to
 * zero. Returns nothing if no brace is found or the block never closes.
 */
std::optional<Block> find_block(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t max_lines,
    std::size_t column = 0);

/**
 * If `line_number` declares a method (Kotlin `fun`, Java method or
 * constructor), return its name.
 */
std::optional<std::string> declared_method_name(
    const SourceFile& file,
    std::size_t line_number);

/**
 * Search backward, at most `search_limit` lines, for the nearest method
 * declaration whose body contains `line_number`. Declarations whose body
 * ends before `line_number` are skipped.
 */
std::optional<Method> find_enclosing_method(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t search_limit);

/**
 * Returns true if any code line in `[line_number - before, line_number +
 * after]`, clipped to the file, matches `pattern`.
 */
bool window_contains(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t before,
    std::size_t after,
    const re2::RE2& pattern);

/* Same as `window_contains` with no line after `line_number`. */
bool lookback_contains(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t before,
    const re2::RE2& pattern);

/* Returns true if any code line of the block matches `pattern`. */
bool block_contains(
    const SourceFile& file,
    const Block& block,
    const re2::RE2& pattern);

/* Returns true if any code line of the method matches `pattern`. */
bool method_contains(
    const SourceFile& file,
    const Method& method,
    const re2::RE2& pattern);

/**
 * Join lines from the first `(` at or after (`line_number`, `column`) until
 * parentheses balance back to zero. Returns nothing when there is no
 * parenthesis on the line or when they do not balance within `max_lines`.
 */
std::optional<Statement> accumulate_call(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t column,
    std::size_t max_lines);

/**
 * Single pass marking the lines that sit inside a `try` (including Java
 * resources) or a `runCatching` block. Indexed by line number; index 0 is
 * unused.
 */
std::vector<bool> try_coverage(const SourceFile& file);

/**
 * Single pass mapping every line to the name of its innermost enclosing
 * method, or an empty string. Indexed by line number; index 0 is unused.
 */
std::vector<std::string> method_names(const SourceFile& file);

} // namespace scanning
} // namespace tracedroid
