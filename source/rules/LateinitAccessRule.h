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
 * A `lateinit var` read from a teardown callback, where it may not have
 * been initialized yet.
 */
class LateinitAccessRule final : public Rule {
 public:
  explicit LateinitAccessRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t method_search_limit_;
};

} // namespace tracedroid
