/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/algorithm/string/case_conv.hpp>

#include <trace-droid/Severity.h>

namespace tracedroid {

std::string_view severity_to_string(Severity severity) {
  switch (severity) {
    case Severity::High:
      return "HIGH";
    case Severity::Medium:
      return "MEDIUM";
    case Severity::Low:
      return "LOW";
  }
  return "UNKNOWN";
}

std::optional<Severity> severity_from_string(std::string_view value) {
  auto upper = boost::algorithm::to_upper_copy(std::string(value));
  if (upper == "HIGH") {
    return Severity::High;
  } else if (upper == "MEDIUM") {
    return Severity::Medium;
  } else if (upper == "LOW") {
    return Severity::Low;
  } else {
    return std::nullopt;
  }
}

bool severity_at_least(Severity left, Severity right) {
  return static_cast<int>(left) <= static_cast<int>(right);
}

std::ostream& operator<<(std::ostream& out, Severity severity) {
  return out << severity_to_string(severity);
}

} // namespace tracedroid
