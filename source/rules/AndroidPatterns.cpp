/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <unordered_set>

#include <trace-droid/RE2.h>
#include <trace-droid/rules/AndroidPatterns.h>

namespace tracedroid {

namespace {

const std::unordered_set<std::string> k_main_thread_methods = {
    "onCreate",
    "onStart",
    "onResume",
    "onClick",
    "onViewCreated",
    "onCreateView",
};

const std::unordered_set<std::string> k_teardown_methods = {
    "onDestroy",
    "onDestroyView",
    "onPause",
    "onStop",
    "onSaveInstanceState",
    "onDetach",
};

// Number of lines between a callback call and the brace opening its body.
constexpr std::size_t k_callback_header_lines = 3;

} // namespace

bool is_main_thread_method(const std::string& method_name) {
  return k_main_thread_methods.count(method_name) > 0;
}

bool is_teardown_method(const std::string& method_name) {
  return k_teardown_methods.count(method_name) > 0;
}

const re2::RE2& async_callback_pattern() {
  static const re2::RE2 pattern(
      R"(\b(?:enqueue|onResponse|onFailure|subscribe|postDelayed|launch|observe|addOnSuccessListener|addOnCompleteListener|addOnFailureListener)\b)");
  return pattern;
}

std::optional<scanning::Block> enclosing_async_callback(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t lookback) {
  if (!file.has_line_number(line_number)) {
    return std::nullopt;
  }
  auto first = line_number > lookback ? line_number - lookback : 1;
  for (auto current = line_number; current >= first; current--) {
    auto column = find_column(file.code(current), async_callback_pattern());
    if (!column) {
      continue;
    }
    auto block = scanning::find_block(
        file, current, k_callback_header_lines, /* column */ *column);
    if (block && block->contains(line_number)) {
      return block;
    }
  }
  return std::nullopt;
}

} // namespace tracedroid
