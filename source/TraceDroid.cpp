/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <iostream>

#include <trace-droid/Heuristics.h>
#include <trace-droid/JsonReaderWriter.h>
#include <trace-droid/ListingCommands.h>
#include <trace-droid/Log.h>
#include <trace-droid/Reporter.h>
#include <trace-droid/Rules.h>
#include <trace-droid/Scanner.h>
#include <trace-droid/Timer.h>
#include <trace-droid/TraceDroid.h>
#include <trace-droid/rules/BuiltinRules.h>

namespace tracedroid {

namespace program_options = boost::program_options;

void TraceDroid::add_options(
    program_options::options_description& options) const {
  options.add_options()(
      "verbosity,v",
      program_options::value<int>(),
      "Logging verbosity, from 0 (errors only) to 5.")(
      "list-rules", "List the built-in rules and exit.");
  Options::add_options(options);
}

ScanResult TraceDroid::scan(
    const Options& options,
    Statistics& statistics,
    std::ostream& output) {
  Timer rules_timer;
  auto rules = Rules::load(options);
  statistics.log_time("load_rules", rules_timer);
  LOG(1, "Loaded {} rules.", rules.size());

  auto scanner = Scanner(std::move(rules), ScanSettings::from_options(options));
  auto result = scanner.scan(options.source_root_directory(), &statistics);

  Timer report_timer;
  output << Reporter::to_text(result);
  if (const auto& output_path = options.output_path()) {
    LOG(1, "Writing report to `{}`.", output_path->string());
    JsonWriter::write_styled_json_file(*output_path, Reporter::to_json(result));
  }
  statistics.log_time("report", report_timer);

  return result;
}

bool TraceDroid::run(const program_options::variables_map& variables) {
  if (variables.count("verbosity")) {
    Logger::set_level(variables["verbosity"].as<int>());
  }

  if (variables.count("list-rules")) {
    ListingCommands::list_all_rules(
        Rules(make_builtin_rules(Heuristics())), std::cout);
    return false;
  }

  auto options = Options::from_variables(variables);
  Statistics statistics;
  auto result = scan(*options, statistics, std::cout);

  if (const auto& metadata_path = options->metadata_output_path()) {
    LOG(1, "Writing metadata to `{}`.", metadata_path->string());
    JsonWriter::write_styled_json_file(*metadata_path, statistics.to_json());
  }

  if (auto threshold = options->fail_on()) {
    return result.has_findings_at_least(*threshold);
  }
  return false;
}

} // namespace tracedroid
