/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

namespace tracedroid {

/**
 * Return a pattern matching the given identifier as a whole word.
 *
 * For instance:
 * ```
 * >>> word("mAdapter")
 * <<< "\bmAdapter\b"
 * ```
 */
std::string word(std::string_view identifier);

/**
 * Throw a `RuleEvaluationError` if the given regular expression did not
 * compile. Patterns built from identifiers found in a file go through this.
 */
const re2::RE2& checked(const re2::RE2& pattern);

/* Return the first capture group of the first match, if any. */
std::optional<std::string> first_capture(
    std::string_view text,
    const re2::RE2& pattern);

/* Return the first capture group of every non-overlapping match. */
std::vector<std::string> all_captures(
    std::string_view text,
    const re2::RE2& pattern);

/* Return the column of the first match, if any. */
std::optional<std::size_t> find_column(
    std::string_view text,
    const re2::RE2& pattern);

/* Return the column of every non-overlapping match. */
std::vector<std::size_t> find_columns(
    std::string_view text,
    const re2::RE2& pattern);

} // namespace tracedroid
