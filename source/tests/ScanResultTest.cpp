/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <sstream>

#include <gmock/gmock.h>

#include <trace-droid/ScanResult.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

namespace {

Finding make_finding(
    const std::string& path,
    std::size_t line_number,
    Severity severity,
    const std::string& rule_name = "null-guard",
    const std::string& detail = "") {
  return Finding(
      path,
      line_number,
      /* issue_type */ "Possible NullPointerException",
      /* matched_code */ "x.length()",
      detail,
      severity,
      /* suggestion */ "Check for null.",
      rule_name,
      /* context */ ">> 1 | x.length()");
}

} // namespace

class ScanResultTest : public test::Test {};

TEST_F(ScanResultTest, Severity) {
  EXPECT_EQ(severity_to_string(Severity::High), "HIGH");
  EXPECT_EQ(severity_to_string(Severity::Medium), "MEDIUM");
  EXPECT_EQ(severity_to_string(Severity::Low), "LOW");

  EXPECT_EQ(severity_from_string("high"), Severity::High);
  EXPECT_EQ(severity_from_string("Medium"), Severity::Medium);
  EXPECT_EQ(severity_from_string("LOW"), Severity::Low);
  EXPECT_EQ(severity_from_string("critical"), std::nullopt);

  EXPECT_TRUE(severity_at_least(Severity::High, Severity::Medium));
  EXPECT_TRUE(severity_at_least(Severity::Medium, Severity::Medium));
  EXPECT_FALSE(severity_at_least(Severity::Low, Severity::Medium));

  std::ostringstream out;
  out << Severity::Medium;
  EXPECT_EQ(out.str(), "MEDIUM");
}

TEST_F(ScanResultTest, FindingOrder) {
  auto a = make_finding("a/Foo.kt", 10, Severity::Low);
  auto b = make_finding("a/Foo.kt", 2, Severity::High);
  auto c = make_finding("a/Bar.kt", 30, Severity::Medium);
  auto d = make_finding("a/Foo.kt", 2, Severity::High, "unsafe-cast");

  EXPECT_LT(c, b);
  EXPECT_LT(b, a);
  EXPECT_LT(b, d);
  EXPECT_FALSE(a < a);

  EXPECT_EQ(a, make_finding("a/Foo.kt", 10, Severity::Low));
  EXPECT_NE(a, make_finding("a/Foo.kt", 10, Severity::Medium));
}

TEST_F(ScanResultTest, FindingToJson) {
  auto finding =
      make_finding("src/Main.kt", 2, Severity::High, "null-guard", "x");
  EXPECT_EQ(
      test::sorted_json(finding.to_json()),
      test::sorted_json(test::parse_json(R"json({
        "file_path": "src/Main.kt",
        "line_number": 2,
        "issue_type": "Possible NullPointerException",
        "severity": "HIGH",
        "matched_code": "x.length()",
        "detail": "x",
        "suggestion": "Check for null.",
        "rule_name": "null-guard",
        "context": ">> 1 | x.length()"
      })json")));
}

TEST_F(ScanResultTest, Empty) {
  ScanResult result;
  EXPECT_TRUE(result.empty());
  EXPECT_TRUE(result.findings().empty());
  EXPECT_TRUE(result.failed_files().empty());
  EXPECT_EQ(result.files_scanned(), 0);
  EXPECT_EQ(result.files_skipped(), 0);
  EXPECT_EQ(result.count(Severity::High), 0);
  EXPECT_FALSE(result.has_findings_at_least(Severity::Low));
}

TEST_F(ScanResultTest, Aggregation) {
  ScanResult result;
  result.add(make_finding("b/Foo.kt", 4, Severity::Medium));
  result.add(std::vector<Finding>{
      make_finding("a/Foo.kt", 9, Severity::Low),
      make_finding("a/Foo.kt", 3, Severity::Medium)});
  result.add_failed_file(FailedFile{"c/Bad.kt", "Permission denied"});
  result.set_files_scanned(3);
  result.set_files_skipped(1);

  EXPECT_FALSE(result.empty());
  EXPECT_EQ(result.findings().size(), 3);
  EXPECT_EQ(result.findings().front().file_path().string(), "b/Foo.kt");
  EXPECT_EQ(result.count(Severity::High), 0);
  EXPECT_EQ(result.count(Severity::Medium), 2);
  EXPECT_EQ(result.count(Severity::Low), 1);
  EXPECT_TRUE(result.has_findings_at_least(Severity::Medium));
  EXPECT_FALSE(result.has_findings_at_least(Severity::High));
  EXPECT_THAT(
      result.failed_files(),
      testing::ElementsAre(FailedFile{"c/Bad.kt", "Permission denied"}));
  EXPECT_EQ(result.files_scanned(), 3);
  EXPECT_EQ(result.files_skipped(), 1);

  auto sorted = result.sorted();
  ASSERT_EQ(sorted.size(), 3);
  EXPECT_EQ(sorted[0].line_number(), 3);
  EXPECT_EQ(sorted[1].line_number(), 9);
  EXPECT_EQ(sorted[2].file_path().string(), "b/Foo.kt");
}

} // namespace tracedroid
