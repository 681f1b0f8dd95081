/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <vector>

#include <trace-droid/Heuristics.h>
#include <trace-droid/Rule.h>

namespace tracedroid {

/* All built-in rules, ordered by code. */
std::vector<std::unique_ptr<Rule>> make_builtin_rules(
    const Heuristics& heuristics);

} // namespace tracedroid
