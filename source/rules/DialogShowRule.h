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

class DialogShowRule final : public Rule {
 public:
  explicit DialogShowRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t callback_lookback_lines_;
};

} // namespace tracedroid
