/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>

#include <json/json.h>

#include <trace-droid/IncludeMacros.h>

namespace tracedroid {

/**
 * Window sizes shared by the rules. Rules copy what they need at
 * construction and never read it again.
 */
class Heuristics final {
 public:
  explicit Heuristics();

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Heuristics)

  static Heuristics from_json(const Json::Value& value);
  Json::Value to_json() const;

  /**
   * Number of lines before a risky operation that are searched for a guard
   * (null check, emptiness check, `hasExtra`, ...).
   */
  std::uint32_t guard_lookback_lines() const {
    return guard_lookback_lines_;
  }

  /* Number of lines after a match searched for a companion call. */
  std::uint32_t guard_lookahead_lines() const {
    return guard_lookahead_lines_;
  }

  /**
   * Number of lines before a match searched for the start of an asynchronous
   * callback (`onResponse`, `postDelayed`, `launch`, ...).
   */
  std::uint32_t callback_lookback_lines() const {
    return callback_lookback_lines_;
  }

  /**
   * Maximum number of lines joined when a call expression spans several
   * lines. Also bounds the search for the `{` opening a block.
   */
  std::uint32_t statement_max_lines() const {
    return statement_max_lines_;
  }

  /**
   * Maximum number of lines searched backward for the declaration of the
   * enclosing method.
   */
  std::uint32_t method_search_limit() const {
    return method_search_limit_;
  }

 private:
  void enforce_heuristics_consistency();

 private:
  std::uint32_t guard_lookback_lines_;
  std::uint32_t guard_lookahead_lines_;
  std::uint32_t callback_lookback_lines_;
  std::uint32_t statement_max_lines_;
  std::uint32_t method_search_limit_;
};

} // namespace tracedroid
