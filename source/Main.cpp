/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <exception>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include <trace-droid/Errors.h>
#include <trace-droid/ExitCode.h>
#include <trace-droid/JsonValidation.h>
#include <trace-droid/TraceDroid.h>

int main(int argc, char* argv[]) {
  namespace program_options = boost::program_options;
  program_options::options_description options;
  options.add_options()("help,h", "Show help dialog.")(
      "config,c",
      program_options::value<std::string>(),
      "Path to the JSON configuration file.");

  auto tool = tracedroid::TraceDroid();
  tool.add_options(options);

  try {
    program_options::variables_map variables;
    program_options::store(
        program_options::parse_command_line(argc, argv, options), variables);
    if (variables.count("help")) {
      std::cerr << options;
      return 0;
    }
    if (!variables.count("list-rules") && !variables.count("config") &&
        !variables.count("source-root-directory")) {
      std::cerr << "error: missing parameter `--config` or "
                   "`--source-root-directory`.\n";
      std::cerr << "Usage: " << argv[0]
                << " --source-root-directory <directory>\n";
      return ExitCode::invalid_argument_error(
          "No source root directory provided.");
    }
    program_options::notify(variables);

    if (tool.run(variables)) {
      return ExitCode::findings_found(
          "Found issues at or above the `--fail-on` severity.");
    }
  } catch (const tracedroid::ConfigurationError& exception) {
    return ExitCode::configuration_error(exception.what());
  } catch (const tracedroid::DirectoryNotFoundError& exception) {
    return ExitCode::directory_not_found_error(exception.what());
  } catch (const tracedroid::JsonValidationError& exception) {
    return ExitCode::configuration_error(exception.what());
  } catch (const program_options::error& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const std::invalid_argument& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const std::runtime_error& exception) {
    return ExitCode::scan_error(exception.what());
  } catch (const std::logic_error& exception) {
    return ExitCode::scan_error(exception.what());
  } catch (const std::exception& exception) {
    return ExitCode::error(exception.what());
  }

  return ExitCode::success();
}
