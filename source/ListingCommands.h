/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>

#include <trace-droid/Rules.h>

namespace tracedroid {

class ListingCommands {
 public:
  static void list_all_rules(const Rules& rules, std::ostream& output);
};

} // namespace tracedroid
