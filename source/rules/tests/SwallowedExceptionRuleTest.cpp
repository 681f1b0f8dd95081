/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/SwallowedExceptionRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class SwallowedExceptionRuleTest : public test::Test {};

TEST_F(SwallowedExceptionRuleTest, Kotlin) {
  auto rule = SwallowedExceptionRule(Heuristics());
  auto file = test::make_source_file(
      "Loader.kt",
      "fun load() {\n"
      "    try {\n"
      "        risky()\n"
      "    } catch (e: Exception) {}\n"
      "    try {\n"
      "        risky()\n"
      "    } catch (e: IOException) {\n"
      "        // ignored\n"
      "    }\n"
      "    try {\n"
      "        risky()\n"
      "    } catch (e: java.lang.RuntimeException) {\n"
      "        log(e)\n"
      "    }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(4, 7));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Medium, Severity::Low));
  EXPECT_EQ(
      matches[0].detail,
      "Empty catch block for `Exception` silently discards every error.");
  EXPECT_EQ(matches[1].detail, "Empty catch block for `IOException`.");
}

TEST_F(SwallowedExceptionRuleTest, JavaMultiCatch) {
  auto rule = SwallowedExceptionRule(Heuristics());
  auto file = test::make_source_file(
      "Loader.java",
      "class Loader {\n"
      "  void load() {\n"
      "    try {\n"
      "      risky();\n"
      "    } catch (IOException | RuntimeException e) {\n"
      "    }\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(5));
  EXPECT_THAT(test::severities(matches), testing::ElementsAre(Severity::Low));
}

} // namespace tracedroid
