/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/CursorLeakRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class CursorLeakRuleTest : public test::Test {};

TEST_F(CursorLeakRuleTest, Kotlin) {
  auto rule = CursorLeakRule(Heuristics());
  auto file = test::make_source_file(
      "Queries.kt",
      "fun leak(db: SQLiteDatabase) {\n"
      "    val cursor = db.rawQuery(\"SELECT * FROM t\", null)\n"
      "    cursor.moveToFirst()\n"
      "}\n"
      "fun closed(db: SQLiteDatabase) {\n"
      "    val c = db.query(\"t\", null, null, null, null, null, null)\n"
      "    c.close()\n"
      "}\n"
      "fun managed(db: SQLiteDatabase) {\n"
      "    db.rawQuery(\"SELECT 1\", null).use { it.moveToFirst() }\n"
      "    val other = db.rawQuery(\"SELECT 2\", null)\n"
      "}\n"
      "fun returned(db: SQLiteDatabase): Cursor {\n"
      "    val result = db.rawQuery(\"SELECT 3\", null)\n"
      "    return result\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2));
  EXPECT_THAT(
      test::severities(matches), testing::ElementsAre(Severity::Medium));
  EXPECT_EQ(matches[0].detail, "Cursor `cursor` is never closed in `leak`.");
}

TEST_F(CursorLeakRuleTest, Java) {
  auto rule = CursorLeakRule(Heuristics());
  auto file = test::make_source_file(
      "Dao.java",
      "class Dao {\n"
      "  void load(SQLiteDatabase db) {\n"
      "    Cursor cursor = db.rawQuery(\"SELECT 1\", null);\n"
      "  }\n"
      "  void safe(SQLiteDatabase db) {\n"
      "    try (Cursor cursor = db.rawQuery(\"SELECT 1\", null)) {\n"
      "    }\n"
      "  }\n"
      "}\n");
  EXPECT_THAT(
      test::line_numbers(rule.analyze(file)), testing::ElementsAre(3));
}

} // namespace tracedroid
