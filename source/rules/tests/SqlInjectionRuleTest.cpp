/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/SqlInjectionRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class SqlInjectionRuleTest : public test::Test {};

TEST_F(SqlInjectionRuleTest, Queries) {
  auto rule = SqlInjectionRule(Heuristics());
  auto file = test::make_source_file(
      "UserDao.kt",
      "fun find(db: SQLiteDatabase, id: String, name: String) {\n"
      "    db.rawQuery(\"SELECT * FROM users WHERE id = \" + id, null)\n"
      "    db.rawQuery(\"SELECT * FROM users WHERE name = ?\", arrayOf(name))\n"
      "    db.execSQL(\"DELETE FROM users WHERE name = '$name'\")\n"
      "    val sql = \"SELECT * FROM users WHERE id = \" + id\n"
      "    db.rawQuery(sql, null)\n"
      "    db.rawQuery(\"SELECT * FROM t WHERE a = \" + id + \" AND b = ?\", arrayOf(name))\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(2, 4, 6, 7));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(
          Severity::High, Severity::High, Severity::High, Severity::Medium));
  EXPECT_EQ(
      matches[0].detail,
      "SQL passed to `rawQuery` is built with string concatenation.");
  EXPECT_EQ(
      matches[1].detail,
      "SQL passed to `execSQL` is built with a string template.");
  EXPECT_EQ(
      matches[2].detail,
      "SQL passed to `rawQuery` is built with `sql`, built by concatenation at line 5.");
}

TEST_F(SqlInjectionRuleTest, Format) {
  auto rule = SqlInjectionRule(Heuristics());
  auto file = test::make_source_file(
      "UserDao.java",
      "class UserDao {\n"
      "  void delete(SQLiteDatabase db, String id) {\n"
      "    db.execSQL(String.format(\"DELETE FROM users WHERE id = %s\", id));\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(3));
  EXPECT_EQ(
      matches[0].detail, "SQL passed to `execSQL` is built with `format`.");
}

} // namespace tracedroid
