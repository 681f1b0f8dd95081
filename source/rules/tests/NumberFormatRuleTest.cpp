/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/NumberFormatRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class NumberFormatRuleTest : public test::Test {};

TEST_F(NumberFormatRuleTest, Java) {
  auto rule = NumberFormatRule(Heuristics());
  auto file = test::make_source_file(
      "Parser.java",
      "class Parser {\n"
      "  int parse(String value) {\n"
      "    int a = Integer.parseInt(value);\n"
      "    int b = Integer.parseInt(\"42\");\n"
      "    return a + b;\n"
      "  }\n"
      "  long safe(String value) {\n"
      "    try {\n"
      "      return Long.parseLong(value);\n"
      "    } catch (NumberFormatException e) {\n"
      "      return 0;\n"
      "    }\n"
      "  }\n"
      "  double mixed(String value) {\n"
      "    double d = Double.parseDouble(value);\n"
      "    try { log(d); } catch (Exception e) {}\n"
      "    return d;\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3, 4, 15));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::High, Severity::Medium, Severity::Medium));
  EXPECT_EQ(
      matches[0].detail,
      "`Integer.parseInt` throws `NumberFormatException` on malformed input and is not inside a try block.");
}

TEST_F(NumberFormatRuleTest, Kotlin) {
  auto rule = NumberFormatRule(Heuristics());
  auto file = test::make_source_file(
      "Form.kt",
      "fun read(input: String, view: TextView) {\n"
      "    val a = input.toInt()\n"
      "    val b = \"7\".toInt()\n"
      "    val c = input.toIntOrNull()\n"
      "    val d = count.toString().length\n"
      "    val e = view.text.toString().toLong()\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2, 3, 6));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::High, Severity::Medium, Severity::High));
}

TEST_F(NumberFormatRuleTest, AfterRunCatchingReference) {
  auto rule = NumberFormatRule(Heuristics());
  auto file = test::make_source_file(
      "Config.kt",
      "fun load() = runCatching(::readConfig)\n"
      "\n"
      "fun parse(s: String): Int {\n"
      "  JSONObject(s)\n"
      "  return Integer.parseInt(s)\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(5));
  EXPECT_THAT(
      test::severities(matches), testing::ElementsAre(Severity::High));
}

} // namespace tracedroid
