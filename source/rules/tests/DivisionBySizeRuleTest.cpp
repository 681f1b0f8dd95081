/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/DivisionBySizeRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class DivisionBySizeRuleTest : public test::Test {};

TEST_F(DivisionBySizeRuleTest, Divisors) {
  auto rule = DivisionBySizeRule(Heuristics());
  auto file = test::make_source_file(
      "Stats.kt",
      "fun average(values: List<Int>, weights: List<Int>): Int {\n"
      "    val mean = values.sum() / values.size\n"
      "    val weighted = total / weights.size.coerceAtLeast(1)\n"
      "    if (weights.isEmpty()) return 0\n"
      "    val ratio = total / weights.size\n"
      "    val rest = total % items.count()\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2, 6));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Medium, Severity::Medium));
  EXPECT_EQ(
      matches[1].detail, "Division by the size of `items`, which may be empty.");
}

} // namespace tracedroid
