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
 * Calls on a `MediaPlayer` that are invalid in its current state, within
 * a single method:
 * - `start()` after `prepareAsync()` without an `OnPreparedListener`.
 * - Any call after `release()`.
 * - `start()` with no preparation in the method.
 */
class MediaPlayerStateRule final : public Rule {
 public:
  explicit MediaPlayerStateRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t method_search_limit_;
};

} // namespace tracedroid
