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
 * Access to a constant index, or `first()` / `last()`, without a size or
 * emptiness check of the same receiver.
 */
class CollectionAccessRule final : public Rule {
 public:
  explicit CollectionAccessRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t lookback_lines_;
  std::size_t method_search_limit_;
};

} // namespace tracedroid
