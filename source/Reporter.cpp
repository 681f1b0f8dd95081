/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string_view>

#include <fmt/format.h>

#include <trace-droid/Reporter.h>

namespace tracedroid {

namespace {

std::string indent(const std::string& text, std::string_view prefix) {
  std::string indented;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    auto end = text.find('\n', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    indented += prefix;
    indented.append(text, begin, end - begin);
    indented += '\n';
    begin = end + 1;
  }
  return indented;
}

std::string pluralize(std::size_t count, std::string_view noun) {
  return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

std::string failed_files_to_text(const ScanResult& result) {
  if (result.failed_files().empty()) {
    return "";
  }
  auto text = fmt::format(
      "{} could not be analyzed:\n",
      pluralize(result.failed_files().size(), "file"));
  for (const auto& failed_file : result.failed_files()) {
    text += fmt::format(
        "  - {}: {}\n", failed_file.path.string(), failed_file.reason);
  }
  return text;
}

} // namespace

std::string Reporter::to_text(const ScanResult& result) {
  if (result.empty()) {
    return "No issues found.\n" + failed_files_to_text(result);
  }

  std::string text;
  std::size_t files = 0;
  const std::filesystem::path* current_file = nullptr;
  auto findings = result.sorted();
  for (const auto& finding : findings) {
    if (current_file == nullptr || *current_file != finding.file_path()) {
      if (current_file != nullptr) {
        text += '\n';
      }
      current_file = &finding.file_path();
      files++;
      text += fmt::format("== {} ==\n", current_file->string());
    }

    text += fmt::format(
        "\n[{}] Line {}: {}\n",
        severity_to_string(finding.severity()),
        finding.line_number(),
        finding.issue_type());
    text += fmt::format("  Code: {}\n", finding.matched_code());
    if (!finding.context().empty()) {
      text += "  Context:\n";
      text += indent(finding.context(), "    ");
    }
    text += fmt::format("  Suggestion: {}\n", finding.suggestion());
    if (!finding.detail().empty()) {
      text += fmt::format("  Detail: {}\n", finding.detail());
    }
    text += fmt::format("  Rule: {}\n", finding.rule_name());
  }

  text += fmt::format(
      "\nSummary: {} ({} HIGH, {} MEDIUM, {} LOW) in {}.\n",
      pluralize(findings.size(), "finding"),
      result.count(Severity::High),
      result.count(Severity::Medium),
      result.count(Severity::Low),
      pluralize(files, "file"));
  text += failed_files_to_text(result);
  return text;
}

Json::Value Reporter::summary_to_json(const ScanResult& result) {
  auto summary = Json::Value(Json::objectValue);
  summary["total"] =
      Json::Value(static_cast<Json::Int64>(result.findings().size()));
  summary["high"] =
      Json::Value(static_cast<Json::Int64>(result.count(Severity::High)));
  summary["medium"] =
      Json::Value(static_cast<Json::Int64>(result.count(Severity::Medium)));
  summary["low"] =
      Json::Value(static_cast<Json::Int64>(result.count(Severity::Low)));
  summary["files_scanned"] =
      Json::Value(static_cast<Json::Int64>(result.files_scanned()));
  summary["files_skipped"] =
      Json::Value(static_cast<Json::Int64>(result.files_skipped()));
  summary["files_failed"] =
      Json::Value(static_cast<Json::Int64>(result.failed_files().size()));
  return summary;
}

Json::Value Reporter::to_json(const ScanResult& result) {
  auto value = Json::Value(Json::objectValue);

  auto findings = Json::Value(Json::arrayValue);
  for (const auto& finding : result.sorted()) {
    findings.append(finding.to_json());
  }
  value["findings"] = findings;

  auto failed_files = Json::Value(Json::arrayValue);
  for (const auto& failed_file : result.failed_files()) {
    auto failed_file_value = Json::Value(Json::objectValue);
    failed_file_value["path"] = failed_file.path.string();
    failed_file_value["reason"] = failed_file.reason;
    failed_files.append(failed_file_value);
  }
  value["failed_files"] = failed_files;

  value["summary"] = summary_to_json(result);
  return value;
}

} // namespace tracedroid
