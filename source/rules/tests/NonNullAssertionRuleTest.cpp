/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/NonNullAssertionRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class NonNullAssertionRuleTest : public test::Test {};

TEST_F(NonNullAssertionRuleTest, Assertions) {
  auto rule = NonNullAssertionRule(Heuristics());
  auto file = test::make_source_file(
      "Details.kt",
      "fun show(user: User?, item: Item?) {\n"
      "    val key = arguments!!.getString(\"key\")\n"
      "    println(user!!.name)\n"
      "    if (item != null) {\n"
      "        use(item!!)\n"
      "    }\n"
      "    val text = \"wow!!\"\n"
      "    // value!! in a comment\n"
      "    val id = intent.getStringExtra(\"id\")!!\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2, 3, 5, 9));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(
          Severity::High, Severity::Medium, Severity::Low, Severity::High));
  EXPECT_EQ(matches[1].detail, "`user!!` throws if `user` is null.");
  EXPECT_EQ(
      matches[2].detail,
      "`item!!` follows an explicit null check of `item`.");
}

TEST_F(NonNullAssertionRuleTest, KotlinOnly) {
  auto rule = NonNullAssertionRule(Heuristics());
  EXPECT_FALSE(rule.applies_to(test::make_source_file("Details.java", "")));
}

} // namespace tracedroid
