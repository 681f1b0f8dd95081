/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <trace-droid/Heuristics.h>
#include <trace-droid/JsonValidation.h>
#include <trace-droid/Log.h>

namespace tracedroid {

namespace {

// Default values for heuristics parameters.
constexpr std::uint32_t guard_lookback_lines_default = 10;
constexpr std::uint32_t guard_lookahead_lines_default = 3;
constexpr std::uint32_t callback_lookback_lines_default = 8;
constexpr std::uint32_t statement_max_lines_default = 20;
constexpr std::uint32_t method_search_limit_default = 400;

} // namespace

Heuristics::Heuristics()
    : guard_lookback_lines_(guard_lookback_lines_default),
      guard_lookahead_lines_(guard_lookahead_lines_default),
      callback_lookback_lines_(callback_lookback_lines_default),
      statement_max_lines_(statement_max_lines_default),
      method_search_limit_(method_search_limit_default) {}

void Heuristics::enforce_heuristics_consistency() {
  if (statement_max_lines_ == 0) {
    WARNING(1, "statement-max-lines must be positive. Using 1 instead.");
    statement_max_lines_ = 1;
  }
  if (method_search_limit_ < guard_lookback_lines_) {
    WARNING(
        1,
        "method-search-limit ({}) is smaller than guard-lookback-lines ({}). "
        "Updating method-search-limit to guard-lookback-lines.",
        method_search_limit_,
        guard_lookback_lines_);
    method_search_limit_ = guard_lookback_lines_;
  }
}

Heuristics Heuristics::from_json(const Json::Value& value) {
  // Start from the default values.
  Heuristics heuristics;
  if (value.isNull()) {
    return heuristics;
  }

  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(
      value,
      {"guard-lookback-lines",
       "guard-lookahead-lines",
       "callback-lookback-lines",
       "statement-max-lines",
       "method-search-limit"});

  if (auto lines = JsonValidation::optional_unsigned_integer(
          value, "guard-lookback-lines")) {
    heuristics.guard_lookback_lines_ = *lines;
  }
  if (auto lines = JsonValidation::optional_unsigned_integer(
          value, "guard-lookahead-lines")) {
    heuristics.guard_lookahead_lines_ = *lines;
  }
  if (auto lines = JsonValidation::optional_unsigned_integer(
          value, "callback-lookback-lines")) {
    heuristics.callback_lookback_lines_ = *lines;
  }
  if (auto lines = JsonValidation::optional_unsigned_integer(
          value, "statement-max-lines")) {
    heuristics.statement_max_lines_ = *lines;
  }
  if (auto lines = JsonValidation::optional_unsigned_integer(
          value, "method-search-limit")) {
    heuristics.method_search_limit_ = *lines;
  }

  heuristics.enforce_heuristics_consistency();
  return heuristics;
}

Json::Value Heuristics::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["guard-lookback-lines"] = Json::Value(guard_lookback_lines_);
  value["guard-lookahead-lines"] = Json::Value(guard_lookahead_lines_);
  value["callback-lookback-lines"] = Json::Value(callback_lookback_lines_);
  value["statement-max-lines"] = Json::Value(statement_max_lines_);
  value["method-search-limit"] = Json::Value(method_search_limit_);
  return value;
}

} // namespace tracedroid
