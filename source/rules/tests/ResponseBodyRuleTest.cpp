/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/ResponseBodyRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class ResponseBodyRuleTest : public test::Test {};

TEST_F(ResponseBodyRuleTest, AppliesTo) {
  auto rule = ResponseBodyRule(Heuristics());
  EXPECT_TRUE(rule.applies_to(
      test::make_source_file("app/peertube/api/Videos.kt", "")));
  EXPECT_TRUE(rule.applies_to(
      test::make_source_file("app/PeerTube/api/Videos.java", "")));
  EXPECT_FALSE(
      rule.applies_to(test::make_source_file("app/api/Videos.kt", "")));
  EXPECT_FALSE(rule.applies_to(
      test::make_source_file("app/peertube/api/README.md", "")));
}

TEST_F(ResponseBodyRuleTest, UncheckedBody) {
  auto rule = ResponseBodyRule(Heuristics());
  auto file = test::make_source_file(
      "app/peertube/api/Videos.kt",
      "fun load(call: Call<Video>) {\n"
      "    val response = call.execute()\n"
      "    val title = response.body()!!.title\n"
      "}\n"
      "fun safe(call: Call<Video>) {\n"
      "    val response = call.execute()\n"
      "    if (!response.isSuccessful) return\n"
      "    val title = response.body()!!.title\n"
      "}\n"
      "fun optional(call: Call<Video>) {\n"
      "    val title = call.execute().body()?.title\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3));
  EXPECT_THAT(test::severities(matches), testing::ElementsAre(Severity::High));
  EXPECT_EQ(
      matches[0].detail,
      "The body of `response` is used without checking that the request succeeded.");
}

} // namespace tracedroid
