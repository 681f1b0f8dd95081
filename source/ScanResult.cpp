/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <iterator>

#include <trace-droid/ScanResult.h>

namespace tracedroid {

void ScanResult::add(Finding finding) {
  findings_.push_back(std::move(finding));
}

void ScanResult::add(std::vector<Finding> findings) {
  findings_.insert(
      findings_.end(),
      std::make_move_iterator(findings.begin()),
      std::make_move_iterator(findings.end()));
}

void ScanResult::add_failed_file(FailedFile failed_file) {
  failed_files_.push_back(std::move(failed_file));
}

std::vector<Finding> ScanResult::sorted() const {
  auto findings = findings_;
  std::stable_sort(findings.begin(), findings.end());
  return findings;
}

std::size_t ScanResult::count(Severity severity) const {
  return std::count_if(
      findings_.begin(), findings_.end(), [severity](const Finding& finding) {
        return finding.severity() == severity;
      });
}

bool ScanResult::has_findings_at_least(Severity threshold) const {
  return std::any_of(
      findings_.begin(), findings_.end(), [threshold](const Finding& finding) {
        return severity_at_least(finding.severity(), threshold);
      });
}

} // namespace tracedroid
