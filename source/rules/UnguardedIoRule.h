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
 * File and stream operations that may throw `IOException`, neither inside
 * a try block nor inside a `use` block, in a method that does not declare
 * the exception.
 */
class UnguardedIoRule final : public Rule {
 public:
  explicit UnguardedIoRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  bool inside_use_block(const SourceFile& file, std::size_t line_number)
      const;

 private:
  std::size_t lookback_lines_;
  std::size_t lookahead_lines_;
  std::size_t method_search_limit_;
};

} // namespace tracedroid
