/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <boost/algorithm/string/trim.hpp>

#include <trace-droid/Log.h>
#include <trace-droid/Rule.h>

namespace tracedroid {

bool Rule::applies_to(const SourceFile& file) const {
  return std::find(languages_.begin(), languages_.end(), file.language()) !=
      languages_.end();
}

RuleMatch Rule::match(
    const SourceFile& file,
    std::size_t line_number,
    Severity severity,
    std::string detail) {
  return RuleMatch{
      line_number,
      boost::algorithm::trim_copy(file.line(line_number)),
      std::move(detail),
      severity};
}

void Rule::skip_occurrence(
    const SourceFile& file,
    std::size_t line_number,
    const RuleEvaluationError& error) const {
  LOG(3,
      "Rule `{}` skipped `{}:{}`: {}",
      name_,
      file.path().string(),
      line_number,
      error.what());
}

Json::Value Rule::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["name"] = name_;
  value["code"] = Json::Value(code_);
  value["issue_type"] = issue_type_;
  value["suggestion"] = suggestion_;
  auto languages = Json::Value(Json::arrayValue);
  for (auto language : languages_) {
    languages.append(std::string(language_to_string(language)));
  }
  value["languages"] = languages;
  return value;
}

} // namespace tracedroid
