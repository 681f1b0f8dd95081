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
 * Retrofit response bodies dereferenced before checking the response.
 * Only applies to the PeerTube client sources.
 */
class ResponseBodyRule final : public Rule {
 public:
  explicit ResponseBodyRule(const Heuristics& heuristics);

  bool applies_to(const SourceFile& file) const override;

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t lookback_lines_;
};

} // namespace tracedroid
