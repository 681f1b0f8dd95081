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
 * Intent extras and bundle lookups dereferenced in the same expression.
 */
class IntentExtraRule final : public Rule {
 public:
  explicit IntentExtraRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t lookback_lines_;
  std::size_t statement_max_lines_;
};

} // namespace tracedroid
