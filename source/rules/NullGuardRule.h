/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <trace-droid/Heuristics.h>
#include <trace-droid/Rule.h>

namespace tracedroid {

/**
 * A Kotlin nullable variable (`val x: T? = ...`) dereferenced with `.`
 * rather than `?.`, with no null check in the lines before.
 */
class NullGuardRule final : public Rule {
 public:
  explicit NullGuardRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  bool guarded(
      const SourceFile& file,
      std::size_t first_line,
      std::size_t last_line,
      const std::string& variable) const;

 private:
  std::size_t lookback_lines_;
  std::size_t method_search_limit_;
};

} // namespace tracedroid
