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
 * Uses of the Kotlin `!!` operator. Assertions on framework getters that
 * are commonly null (`arguments`, `activity`, `findViewById`, ...) are the
 * most likely to crash.
 */
class NonNullAssertionRule final : public Rule {
 public:
  explicit NonNullAssertionRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t lookback_lines_;
};

} // namespace tracedroid
