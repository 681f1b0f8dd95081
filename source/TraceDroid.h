/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>

#include <boost/program_options.hpp>

#include <trace-droid/Options.h>
#include <trace-droid/ScanResult.h>
#include <trace-droid/Statistics.h>

namespace tracedroid {

class TraceDroid {
 public:
  TraceDroid() = default;

  void add_options(boost::program_options::options_description& options) const;

  /**
   * Run the tool. Returns true if a finding reaches the `--fail-on`
   * severity.
   */
  bool run(const boost::program_options::variables_map& variables);

  /* Scan the configured tree, write the reports and return the result. */
  static ScanResult scan(
      const Options& options,
      Statistics& statistics,
      std::ostream& output);
};

} // namespace tracedroid
