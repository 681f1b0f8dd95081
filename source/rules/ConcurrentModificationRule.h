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
 * A collection modified while it is being iterated over. Only loops with a
 * brace-delimited body are considered.
 */
class ConcurrentModificationRule final : public Rule {
 public:
  explicit ConcurrentModificationRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t statement_max_lines_;
};

} // namespace tracedroid
