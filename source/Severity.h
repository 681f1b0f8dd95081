/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tracedroid {

/* Ordered from the most to the least severe. */
enum class Severity {
  High,
  Medium,
  Low,
};

std::string_view severity_to_string(Severity severity);

std::optional<Severity> severity_from_string(std::string_view value);

/* Returns true if `left` is at least as severe as `right`. */
bool severity_at_least(Severity left, Severity right);

std::ostream& operator<<(std::ostream& out, Severity severity);

} // namespace tracedroid
