/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/UnsafeCastRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class UnsafeCastRuleTest : public test::Test {};

TEST_F(UnsafeCastRuleTest, Kotlin) {
  auto rule = UnsafeCastRule(Heuristics());
  auto file = test::make_source_file(
      "Casts.kt",
      "import com.example.ui.MainActivity as Act\n"
      "fun bind(view: View, context: Context) {\n"
      "    val text = view as TextView\n"
      "    if (context is Activity) {\n"
      "        val activity = context as Activity\n"
      "    }\n"
      "    val label = view as? TextView\n"
      "    val message = \"shown as Toast\"\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3, 5));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Medium, Severity::Low));
  EXPECT_EQ(
      matches[0].detail,
      "Cast to `TextView` throws `ClassCastException` if the value has another type.");
  EXPECT_EQ(matches[1].detail, "Cast to `Activity` follows a type check.");
}

TEST_F(UnsafeCastRuleTest, Java) {
  auto rule = UnsafeCastRule(Heuristics());
  auto file = test::make_source_file(
      "Casts.java",
      "public class Casts {\n"
      "  void bind(Context context, Bundle bundle) {\n"
      "    LocationManager manager = (LocationManager) context.getSystemService(Context.LOCATION_SERVICE);\n"
      "    if (bundle.get(\"user\") instanceof User) {\n"
      "      User user = (User) bundle.getSerializable(\"user\");\n"
      "    }\n"
      "    int count = (int) value;\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3, 5));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Medium, Severity::Low));
}

} // namespace tracedroid
