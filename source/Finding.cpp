/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <tuple>

#include <trace-droid/Finding.h>

namespace tracedroid {

bool Finding::operator==(const Finding& other) const {
  return file_path_ == other.file_path_ &&
      line_number_ == other.line_number_ &&
      issue_type_ == other.issue_type_ &&
      matched_code_ == other.matched_code_ && detail_ == other.detail_ &&
      severity_ == other.severity_ && suggestion_ == other.suggestion_ &&
      rule_name_ == other.rule_name_ && context_ == other.context_;
}

bool Finding::operator<(const Finding& other) const {
  // Compare paths as strings, `std::filesystem::path` compares by element.
  return std::forward_as_tuple(
             file_path_.native(), line_number_, rule_name_, detail_) <
      std::forward_as_tuple(
             other.file_path_.native(),
             other.line_number_,
             other.rule_name_,
             other.detail_);
}

Json::Value Finding::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["file_path"] = file_path_.string();
  // Signed, to compare equal to parsed JSON.
  value["line_number"] = Json::Value(static_cast<Json::Int64>(line_number_));
  value["issue_type"] = issue_type_;
  value["severity"] = std::string(severity_to_string(severity_));
  value["matched_code"] = matched_code_;
  value["detail"] = detail_;
  value["suggestion"] = suggestion_;
  value["rule_name"] = rule_name_;
  value["context"] = context_;
  return value;
}

std::ostream& operator<<(std::ostream& out, const Finding& finding) {
  return out << "Finding(file_path=" << finding.file_path_.string()
             << ", line_number=" << finding.line_number_
             << ", rule_name=" << finding.rule_name_
             << ", severity=" << finding.severity_ << ", issue_type=`"
             << finding.issue_type_ << "`, matched_code=`"
             << finding.matched_code_ << "`, detail=`" << finding.detail_
             << "`)";
}

} // namespace tracedroid
