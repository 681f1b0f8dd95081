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
 * `requireContext()` and friends called from an asynchronous callback, at
 * which point the fragment may be detached.
 */
class FragmentContextRule final : public Rule {
 public:
  explicit FragmentContextRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t callback_lookback_lines_;
};

} // namespace tracedroid
