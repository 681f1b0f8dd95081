/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/CursorAccessRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class CursorAccessRuleTest : public test::Test {};

TEST_F(CursorAccessRuleTest, Kotlin) {
  auto rule = CursorAccessRule(Heuristics());
  auto file = test::make_source_file(
      "Names.kt",
      "fun names(db: SQLiteDatabase): List<String> {\n"
      "    val cursor = db.rawQuery(\"SELECT name FROM t\", null)\n"
      "    val first = cursor.getString(0)\n"
      "    cursor.close()\n"
      "    return listOf(first)\n"
      "}\n"
      "fun ids(c: Cursor): List<Long> {\n"
      "    val ids = mutableListOf<Long>()\n"
      "    while (c.moveToNext()) {\n"
      "        ids.add(c.getLong(c.getColumnIndex(\"id\")))\n"
      "        val checked = c.getLong(c.getColumnIndexOrThrow(\"id\"))\n"
      "    }\n"
      "    return ids\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3, 10));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::High, Severity::Medium));
  EXPECT_EQ(
      matches[0].detail,
      "`cursor.getString` reads from a cursor that is never moved to a row in `names`.");
}

TEST_F(CursorAccessRuleTest, Java) {
  auto rule = CursorAccessRule(Heuristics());
  auto file = test::make_source_file(
      "Dao.java",
      "class Dao {\n"
      "  String name(Cursor cursor) {\n"
      "    if (cursor.moveToFirst()) {\n"
      "      return cursor.getString(cursor.getColumnIndexOrThrow(\"name\"));\n"
      "    }\n"
      "    return null;\n"
      "  }\n"
      "}\n");
  EXPECT_TRUE(rule.analyze(file).empty());
}

} // namespace tracedroid
