/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/GlobalScopeRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class GlobalScopeRuleTest : public test::Test {};

TEST_F(GlobalScopeRuleTest, Coroutines) {
  auto rule = GlobalScopeRule(Heuristics());
  auto file = test::make_source_file(
      "SyncActivity.kt",
      "class SyncActivity : Activity() {\n"
      "    override fun onCreate(savedInstanceState: Bundle?) {\n"
      "        GlobalScope.launch { sync() }\n"
      "        val config = runBlocking { loadConfig() }\n"
      "    }\n"
      "    fun refresh() = runBlocking { reload() }\n"
      "    fun later() {\n"
      "        GlobalScope.async(Dispatchers.IO) { fetch() }\n"
      "    }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3, 4, 8));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Low, Severity::Medium, Severity::Low));
  EXPECT_EQ(
      matches[0].detail,
      "`GlobalScope.launch` outlives the component that started it.");
  EXPECT_EQ(matches[1].detail, "`runBlocking` blocks the main thread in `onCreate`.");
}

TEST_F(GlobalScopeRuleTest, KotlinOnly) {
  auto rule = GlobalScopeRule(Heuristics());
  EXPECT_TRUE(rule.applies_to(test::make_source_file("Sync.kt", "")));
  EXPECT_FALSE(rule.applies_to(test::make_source_file("Sync.java", "")));
}

} // namespace tracedroid
