/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <json/json.h>

#include <trace-droid/ScanResult.h>

namespace tracedroid {

/**
 * Renders a scan result. Findings are grouped by file and sorted by line
 * number, so the output does not depend on the order they were found in.
 */
class Reporter final {
 public:
  static std::string to_text(const ScanResult& result);

  /**
   * ```
   * {
   *   "findings": [{"file_path": ..., "line_number": ..., ...}, ...],
   *   "failed_files": [{"path": ..., "reason": ...}, ...],
   *   "summary": {"total": ..., "high": ..., ...}
   * }
   * ```
   */
  static Json::Value to_json(const ScanResult& result);

  static Json::Value summary_to_json(const ScanResult& result);
};

} // namespace tracedroid
