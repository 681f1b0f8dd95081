/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <json/json.h>

#include <trace-droid/Heuristics.h>
#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Severity.h>

namespace tracedroid {

class Options final {
 public:
  explicit Options(const Json::Value& json);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Options)

  static void add_options(boost::program_options::options_description& options);

  /**
   * Build the configuration from the `--config` file, if any, overridden by
   * the command line flags.
   */
  static std::unique_ptr<Options> from_variables(
      const boost::program_options::variables_map& variables);

  static std::unique_ptr<Options> from_json_file(
      const std::filesystem::path& options_json_path);

  const std::filesystem::path& source_root_directory() const;
  const std::vector<std::string>& extensions() const;
  const std::vector<std::string>& source_exclude_directories() const;

  /* Rules to run. All built-in rules when absent. */
  const std::optional<std::vector<std::string>>& enabled_rules() const;
  const std::vector<std::string>& disabled_rules() const;

  std::size_t context_lines() const;
  bool sequential() const;
  std::size_t jobs() const;

  const std::optional<std::filesystem::path>& output_path() const;
  const std::optional<std::filesystem::path>& metadata_output_path() const;

  std::optional<Severity> fail_on() const;

  const Heuristics& heuristics() const;

 private:
  std::filesystem::path source_root_directory_;
  std::vector<std::string> extensions_;
  std::vector<std::string> source_exclude_directories_;
  std::optional<std::vector<std::string>> enabled_rules_;
  std::vector<std::string> disabled_rules_;
  std::size_t context_lines_;
  bool sequential_;
  std::size_t jobs_;
  std::optional<std::filesystem::path> output_path_;
  std::optional<std::filesystem::path> metadata_output_path_;
  std::optional<Severity> fail_on_;
  Heuristics heuristics_;
};

} // namespace tracedroid
