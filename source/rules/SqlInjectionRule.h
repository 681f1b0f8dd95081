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
 * SQL statements built from untrusted strings.
 *
 * The arguments of `rawQuery`, `execSQL`, `query` and `compileStatement`
 * are joined across lines before looking for string concatenation, string
 * templates or `String.format`.
 */
class SqlInjectionRule final : public Rule {
 public:
  explicit SqlInjectionRule(const Heuristics& heuristics);

  std::vector<RuleMatch> analyze(const SourceFile& file) const override;

 private:
  std::size_t lookback_lines_;
  std::size_t statement_max_lines_;
};

} // namespace tracedroid
