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
 * Coroutines that are not tied to a lifecycle, and blocking coroutine
 * builders on the main thread.
 */
class GlobalScopeRule final : public Rule {
 public:
  explicit GlobalScopeRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;
};

} // namespace tracedroid
