/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/IntentExtraRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class IntentExtraRuleTest : public test::Test {};

TEST_F(IntentExtraRuleTest, Kotlin) {
  auto rule = IntentExtraRule(Heuristics());
  auto file = test::make_source_file(
      "DetailActivity.kt",
      "fun read() {\n"
      "    val length = intent.getStringExtra(\"id\").length\n"
      "    val name = intent.extras.getString(\"name\")\n"
      "    if (intent.hasExtra(\"count\")) {\n"
      "        val count = intent.getStringExtra(\"count\").toInt()\n"
      "    }\n"
      "    val raw = intent.getStringExtra(\"raw\")\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2, 3, 5));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::High, Severity::High, Severity::Medium));
  EXPECT_EQ(
      matches[0].detail,
      "Result of `getStringExtra` is dereferenced without checking that the extra exists.");
}

TEST_F(IntentExtraRuleTest, Java) {
  auto rule = IntentExtraRule(Heuristics());
  auto file = test::make_source_file(
      "DetailActivity.java",
      "class DetailActivity extends Activity {\n"
      "  void read() {\n"
      "    String value = getIntent().getExtras().getString(\"key\").trim();\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3));
  EXPECT_EQ(
      matches[0].detail,
      "Result of `extras` is dereferenced without checking that the extra exists.");
}

} // namespace tracedroid
