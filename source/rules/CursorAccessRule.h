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
 * Cursor reads in a method that never moves the cursor to a row.
 */
class CursorAccessRule final : public Rule {
 public:
  explicit CursorAccessRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t method_search_limit_;
  std::size_t statement_max_lines_;
};

} // namespace tracedroid
