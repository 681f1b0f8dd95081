/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/Reporter.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

namespace {

ScanResult make_result() {
  ScanResult result;
  result.add(Finding(
      "src/B.kt",
      7,
      /* issue_type */ "Unsafe cast",
      /* matched_code */ "val a = b as Activity",
      /* detail */ "",
      Severity::Medium,
      /* suggestion */ "Use `as?`.",
      /* rule_name */ "unsafe-cast",
      /* context */ ">> 7 | val a = b as Activity"));
  result.add(Finding(
      "src/A.kt",
      2,
      /* issue_type */ "Possible NullPointerException",
      /* matched_code */ "x.length()",
      /* detail */ "`x` is nullable",
      Severity::High,
      /* suggestion */ "Check `x` for null.",
      /* rule_name */ "null-guard",
      /* context */ "   1 | val x: String? = null\n>> 2 | x.length()"));
  result.set_files_scanned(3);
  return result;
}

} // namespace

class ReporterTest : public test::Test {};

TEST_F(ReporterTest, EmptyText) {
  ScanResult result;
  EXPECT_EQ(Reporter::to_text(result), "No issues found.\n");

  result.add_failed_file(FailedFile{"src/C.kt", "Permission denied"});
  EXPECT_EQ(
      Reporter::to_text(result),
      "No issues found.\n"
      "1 file could not be analyzed:\n"
      "  - src/C.kt: Permission denied\n");
}

TEST_F(ReporterTest, Text) {
  auto result = make_result();
  EXPECT_EQ(
      Reporter::to_text(result),
      "== src/A.kt ==\n"
      "\n"
      "[HIGH] Line 2: Possible NullPointerException\n"
      "  Code: x.length()\n"
      "  Context:\n"
      "       1 | val x: String? = null\n"
      "    >> 2 | x.length()\n"
      "  Suggestion: Check `x` for null.\n"
      "  Detail: `x` is nullable\n"
      "  Rule: null-guard\n"
      "\n"
      "== src/B.kt ==\n"
      "\n"
      "[MEDIUM] Line 7: Unsafe cast\n"
      "  Code: val a = b as Activity\n"
      "  Context:\n"
      "    >> 7 | val a = b as Activity\n"
      "  Suggestion: Use `as?`.\n"
      "  Rule: unsafe-cast\n"
      "\n"
      "Summary: 2 findings (1 HIGH, 1 MEDIUM, 0 LOW) in 2 files.\n");
}

TEST_F(ReporterTest, TextWithFailedFiles) {
  auto result = make_result();
  result.add_failed_file(FailedFile{"src/C.kt", "Permission denied"});
  result.add_failed_file(FailedFile{"src/D.kt", "rule `unsafe-cast`: oops"});
  EXPECT_THAT(
      Reporter::to_text(result),
      testing::EndsWith(
          "Summary: 2 findings (1 HIGH, 1 MEDIUM, 0 LOW) in 2 files.\n"
          "2 files could not be analyzed:\n"
          "  - src/C.kt: Permission denied\n"
          "  - src/D.kt: rule `unsafe-cast`: oops\n"));
}

TEST_F(ReporterTest, TextSingleFinding) {
  ScanResult result;
  result.add(Finding(
      "Main.kt",
      1,
      /* issue_type */ "Swallowed exception",
      /* matched_code */ "catch (e: IOException) {}",
      /* detail */ "",
      Severity::Low,
      /* suggestion */ "Log the exception.",
      /* rule_name */ "swallowed-exception",
      /* context */ ""));
  EXPECT_EQ(
      Reporter::to_text(result),
      "== Main.kt ==\n"
      "\n"
      "[LOW] Line 1: Swallowed exception\n"
      "  Code: catch (e: IOException) {}\n"
      "  Suggestion: Log the exception.\n"
      "  Rule: swallowed-exception\n"
      "\n"
      "Summary: 1 finding (0 HIGH, 0 MEDIUM, 1 LOW) in 1 file.\n");
}

TEST_F(ReporterTest, Json) {
  auto result = make_result();
  result.add_failed_file(FailedFile{"src/C.kt", "Permission denied"});
  result.set_files_skipped(4);

  auto value = Reporter::to_json(result);
  ASSERT_EQ(value["findings"].size(), 2);
  EXPECT_EQ(value["findings"][0]["file_path"].asString(), "src/A.kt");
  EXPECT_EQ(value["findings"][0]["severity"].asString(), "HIGH");
  EXPECT_EQ(value["findings"][1]["rule_name"].asString(), "unsafe-cast");

  EXPECT_EQ(
      value["failed_files"],
      test::parse_json(R"([
        {"path": "src/C.kt", "reason": "Permission denied"}
      ])"));
  EXPECT_EQ(
      value["summary"],
      test::parse_json(R"({
        "total": 2,
        "high": 1,
        "medium": 1,
        "low": 0,
        "files_scanned": 3,
        "files_skipped": 4,
        "files_failed": 1
      })"));
}

TEST_F(ReporterTest, EmptyJson) {
  EXPECT_EQ(
      Reporter::to_json(ScanResult()),
      test::parse_json(R"({
        "findings": [],
        "failed_files": [],
        "summary": {
          "total": 0,
          "high": 0,
          "medium": 0,
          "low": 0,
          "files_scanned": 0,
          "files_skipped": 0,
          "files_failed": 0
        }
      })"));
}

} // namespace tracedroid
