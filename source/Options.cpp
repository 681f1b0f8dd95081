/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <thread>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <trace-droid/ContextExtractor.h>
#include <trace-droid/JsonReaderWriter.h>
#include <trace-droid/JsonValidation.h>
#include <trace-droid/Log.h>
#include <trace-droid/Options.h>

namespace tracedroid {

namespace program_options = boost::program_options;

namespace {

const std::vector<std::string> k_default_extensions = {".kt", ".java"};

const std::vector<std::string> k_default_exclude_directories = {
    "build",
    ".gradle",
    ".git",
    ".idea",
};

/* Parse a ','- or ';'-separated list. */
std::vector<std::string> parse_list(const std::string& input) {
  std::vector<std::string> elements;
  boost::split(elements, input, boost::is_any_of(",;"));
  elements.erase(
      std::remove_if(
          elements.begin(),
          elements.end(),
          [](const std::string& element) { return element.empty(); }),
      elements.end());
  return elements;
}

Json::Value to_json_array(const std::vector<std::string>& elements) {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& element : elements) {
    value.append(element);
  }
  return value;
}

std::string normalize_extension(std::string extension) {
  if (!extension.empty() && extension.front() != '.') {
    extension.insert(extension.begin(), '.');
  }
  return extension;
}

std::size_t default_jobs() {
  auto threads = std::thread::hardware_concurrency();
  return threads == 0 ? 1 : threads;
}

} // namespace

Options::Options(const Json::Value& json) {
  LOG(2, "Arguments: {}", JsonWriter::to_styled_string(json));

  JsonValidation::validate_object(json);
  JsonValidation::check_unexpected_members(
      json,
      {"source-root-directory",
       "extensions",
       "source-exclude-directories",
       "enabled-rules",
       "disabled-rules",
       "context-lines",
       "sequential",
       "jobs",
       "output-path",
       "metadata-output-path",
       "fail-on",
       "heuristics"});

  source_root_directory_ = std::filesystem::path(
      JsonValidation::string(json, "source-root-directory"));

  extensions_ = JsonValidation::optional_string_list(json, "extensions")
                    .value_or(k_default_extensions);
  std::transform(
      extensions_.begin(),
      extensions_.end(),
      extensions_.begin(),
      normalize_extension);

  source_exclude_directories_ =
      JsonValidation::optional_string_list(json, "source-exclude-directories")
          .value_or(k_default_exclude_directories);

  enabled_rules_ = JsonValidation::optional_string_list(json, "enabled-rules");
  disabled_rules_ = JsonValidation::optional_string_list(json, "disabled-rules")
                        .value_or(std::vector<std::string>{});

  context_lines_ =
      JsonValidation::optional_unsigned_integer(json, "context-lines")
          .value_or(k_default_context_lines);
  sequential_ = JsonValidation::optional_boolean(json, "sequential", false);
  jobs_ = JsonValidation::optional_unsigned_integer(json, "jobs")
              .value_or(default_jobs());
  if (jobs_ == 0) {
    throw JsonValidationError(
        json, /* field */ "jobs", /* expected */ "a positive number of jobs");
  }

  if (auto output_path = JsonValidation::optional_string(json, "output-path")) {
    output_path_ = std::filesystem::path(*output_path);
  }
  if (auto metadata_output_path =
          JsonValidation::optional_string(json, "metadata-output-path")) {
    metadata_output_path_ = std::filesystem::path(*metadata_output_path);
  }

  if (auto fail_on = JsonValidation::optional_string(json, "fail-on")) {
    fail_on_ = severity_from_string(*fail_on);
    if (!fail_on_) {
      throw JsonValidationError(
          json, /* field */ "fail-on", /* expected */ "HIGH, MEDIUM or LOW");
    }
  }

  heuristics_ =
      Heuristics::from_json(JsonValidation::null_or_object(json, "heuristics"));
}

void Options::add_options(
    boost::program_options::options_description& options) {
  options.add_options()(
      "source-root-directory",
      program_options::value<std::string>(),
      "The root of the source tree to scan.")(
      "extensions",
      program_options::value<std::string>(),
      "A `;` separated list of file extensions to scan (default: .kt;.java).")(
      "source-exclude-directories",
      program_options::value<std::string>(),
      "A `;` separated list of directories, relative to the root, to skip.")(
      "enable-rule",
      program_options::value<std::vector<std::string>>()->multitoken(),
      "Only run the given rules.")(
      "disable-rule",
      program_options::value<std::vector<std::string>>()->multitoken(),
      "Do not run the given rules.")(
      "context-lines",
      program_options::value<unsigned>(),
      "Number of lines of context shown around each finding.")(
      "sequential", "Scan files one at a time.")(
      "jobs,j",
      program_options::value<unsigned>(),
      "Number of files scanned in parallel.")(
      "output-path",
      program_options::value<std::string>(),
      "Write the JSON report to this file.")(
      "metadata-output-path",
      program_options::value<std::string>(),
      "Write the scan statistics to this file.")(
      "fail-on",
      program_options::value<std::string>(),
      "Exit with a non-zero status if a finding has this severity or a higher one.");
}

std::unique_ptr<Options> Options::from_variables(
    const program_options::variables_map& variables) {
  Json::Value json = Json::Value(Json::objectValue);
  if (variables.count("config")) {
    json = JsonReader::parse_json_file(
        std::filesystem::path(variables["config"].as<std::string>()));
    JsonValidation::validate_object(json);
  }

  Json::Value overrides = Json::Value(Json::objectValue);
  if (variables.count("source-root-directory")) {
    overrides["source-root-directory"] =
        variables["source-root-directory"].as<std::string>();
  }
  if (variables.count("extensions")) {
    overrides["extensions"] =
        to_json_array(parse_list(variables["extensions"].as<std::string>()));
  }
  if (variables.count("source-exclude-directories")) {
    overrides["source-exclude-directories"] = to_json_array(
        parse_list(variables["source-exclude-directories"].as<std::string>()));
  }
  if (variables.count("enable-rule")) {
    overrides["enabled-rules"] = to_json_array(
        variables["enable-rule"].as<std::vector<std::string>>());
  }
  if (variables.count("disable-rule")) {
    overrides["disabled-rules"] = to_json_array(
        variables["disable-rule"].as<std::vector<std::string>>());
  }
  if (variables.count("context-lines")) {
    overrides["context-lines"] =
        Json::Value(variables["context-lines"].as<unsigned>());
  }
  if (variables.count("sequential")) {
    overrides["sequential"] = true;
  }
  if (variables.count("jobs")) {
    overrides["jobs"] = Json::Value(variables["jobs"].as<unsigned>());
  }
  if (variables.count("output-path")) {
    overrides["output-path"] = variables["output-path"].as<std::string>();
  }
  if (variables.count("metadata-output-path")) {
    overrides["metadata-output-path"] =
        variables["metadata-output-path"].as<std::string>();
  }
  if (variables.count("fail-on")) {
    overrides["fail-on"] = variables["fail-on"].as<std::string>();
  }

  JsonValidation::update_object(json, overrides);
  return std::make_unique<Options>(json);
}

std::unique_ptr<Options> Options::from_json_file(
    const std::filesystem::path& options_json_path) {
  Json::Value json = JsonReader::parse_json_file(options_json_path);
  JsonValidation::validate_object(json);
  return std::make_unique<Options>(json);
}

const std::filesystem::path& Options::source_root_directory() const {
  return source_root_directory_;
}

const std::vector<std::string>& Options::extensions() const {
  return extensions_;
}

const std::vector<std::string>& Options::source_exclude_directories() const {
  return source_exclude_directories_;
}

const std::optional<std::vector<std::string>>& Options::enabled_rules() const {
  return enabled_rules_;
}

const std::vector<std::string>& Options::disabled_rules() const {
  return disabled_rules_;
}

std::size_t Options::context_lines() const {
  return context_lines_;
}

bool Options::sequential() const {
  return sequential_;
}

std::size_t Options::jobs() const {
  return jobs_;
}

const std::optional<std::filesystem::path>& Options::output_path() const {
  return output_path_;
}

const std::optional<std::filesystem::path>& Options::metadata_output_path()
    const {
  return metadata_output_path_;
}

std::optional<Severity> Options::fail_on() const {
  return fail_on_;
}

const Heuristics& Options::heuristics() const {
  return heuristics_;
}

} // namespace tracedroid
