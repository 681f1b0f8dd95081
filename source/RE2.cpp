/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <fmt/format.h>

#include <trace-droid/Errors.h>
#include <trace-droid/RE2.h>

namespace tracedroid {

std::string word(std::string_view identifier) {
  return fmt::format(
      "\\b{}\\b",
      re2::RE2::QuoteMeta(
          re2::StringPiece(identifier.data(), identifier.size())));
}

const re2::RE2& checked(const re2::RE2& pattern) {
  if (!pattern.ok()) {
    throw RuleEvaluationError(fmt::format(
        "Invalid regular expression `{}`: {}",
        pattern.pattern(),
        pattern.error()));
  }
  return pattern;
}

std::optional<std::string> first_capture(
    std::string_view text,
    const re2::RE2& pattern) {
  std::string capture;
  if (re2::RE2::PartialMatch(
          re2::StringPiece(text.data(), text.size()), pattern, &capture)) {
    return capture;
  }
  return std::nullopt;
}

std::vector<std::string> all_captures(
    std::string_view text,
    const re2::RE2& pattern) {
  std::vector<std::string> captures;
  re2::StringPiece input(text.data(), text.size());
  std::string capture;
  while (re2::RE2::FindAndConsume(&input, pattern, &capture)) {
    captures.push_back(capture);
  }
  return captures;
}

std::optional<std::size_t> find_column(
    std::string_view text,
    const re2::RE2& pattern) {
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece match;
  if (!pattern.Match(
          input, 0, input.size(), re2::RE2::UNANCHORED, &match, 1)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(match.data() - input.data());
}

std::vector<std::size_t> find_columns(
    std::string_view text,
    const re2::RE2& pattern) {
  std::vector<std::size_t> columns;
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece match;
  std::size_t position = 0;
  while (position <= input.size() &&
         pattern.Match(
             input, position, input.size(), re2::RE2::UNANCHORED, &match, 1)) {
    auto column = static_cast<std::size_t>(match.data() - input.data());
    columns.push_back(column);
    position = column + std::max<std::size_t>(match.size(), 1);
  }
  return columns;
}

} // namespace tracedroid
