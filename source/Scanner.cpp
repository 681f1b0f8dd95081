/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>

#include <trace-droid/Errors.h>
#include <trace-droid/Log.h>
#include <trace-droid/Options.h>
#include <trace-droid/Scanner.h>
#include <trace-droid/Statistics.h>
#include <trace-droid/Timer.h>

namespace tracedroid {

ScanSettings ScanSettings::from_options(const Options& options) {
  ScanSettings settings;
  settings.extensions = options.extensions();
  settings.exclude_directories = options.source_exclude_directories();
  settings.context_lines = options.context_lines();
  settings.sequential = options.sequential();
  settings.jobs = options.jobs();
  return settings;
}

Scanner::Scanner(
    Rules rules,
    ScanSettings settings,
    filesystem::LineReader reader)
    : rules_(std::move(rules)),
      settings_(std::move(settings)),
      reader_(std::move(reader)),
      context_extractor_(reader_, settings_.context_lines) {
  if (rules_.empty()) {
    throw ConfigurationError("The scanner needs at least one rule.");
  }
}

bool Scanner::is_excluded(const std::filesystem::path& relative_path) const {
  for (const auto& exclude : settings_.exclude_directories) {
    auto excluded = std::filesystem::path(exclude).lexically_normal();
    if (excluded.empty()) {
      continue;
    }

    if (std::distance(excluded.begin(), excluded.end()) == 1) {
      // A single name matches a directory with that name at any depth.
      if (std::find(relative_path.begin(), relative_path.end(), excluded) !=
          relative_path.end()) {
        return true;
      }
      continue;
    }

    auto mismatch = std::mismatch(
        excluded.begin(),
        excluded.end(),
        relative_path.begin(),
        relative_path.end());
    if (mismatch.first == excluded.end()) {
      return true;
    }
  }
  return false;
}

bool Scanner::has_extension(const std::filesystem::path& path) const {
  auto extension = path.extension().string();
  return std::find(
             settings_.extensions.begin(),
             settings_.extensions.end(),
             extension) != settings_.extensions.end();
}

CandidateFiles Scanner::collect_files(
    const std::filesystem::path& root) const {
  std::error_code error;
  if (!std::filesystem::is_directory(root, error)) {
    throw DirectoryNotFoundError(root);
  }

  CandidateFiles candidates;
  auto iterator = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    throw DirectoryNotFoundError(root);
  }

  for (; iterator != std::filesystem::recursive_directory_iterator();
       iterator.increment(error)) {
    const auto& entry = *iterator;
    auto relative_path = entry.path().lexically_relative(root);

    std::error_code status_error;
    if (entry.is_directory(status_error)) {
      if (is_excluded(relative_path)) {
        LOG(3, "Skipping excluded directory `{}`.", relative_path.string());
        iterator.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(status_error)) {
      continue;
    }

    if (!has_extension(entry.path()) || is_excluded(relative_path)) {
      LOG(5, "Skipping `{}`.", relative_path.string());
      candidates.skipped++;
      continue;
    }
    candidates.files.push_back(entry.path());
  }
  if (error) {
    WARNING(
        1,
        "Stopped listing files under `{}`: {}",
        root.string(),
        error.message());
  }

  std::sort(candidates.files.begin(), candidates.files.end());
  return candidates;
}

std::vector<Finding> Scanner::analyze(
    const SourceFile& file,
    std::vector<FailedFile>& failures) const {
  struct Located {
    const Rule* rule;
    RuleMatch match;
  };
  std::vector<Located> located;

  for (const auto* rule : rules_) {
    if (!rule->applies_to(file)) {
      continue;
    }

    std::vector<RuleMatch> matches;
    try {
      matches = rule->analyze(file);
    } catch (const std::exception& exception) {
      WARNING(
          1,
          "Rule `{}` failed on `{}`: {}",
          rule->name(),
          file.path().string(),
          exception.what());
      failures.push_back(FailedFile{
          file.path(),
          fmt::format("rule `{}`: {}", rule->name(), exception.what())});
      continue;
    }

    for (auto& match : matches) {
      if (!file.has_line_number(match.line_number)) {
        WARNING(
            1,
            "Rule `{}` reported line {} of `{}` which only has {} lines.",
            rule->name(),
            match.line_number,
            file.path().string(),
            file.size());
        continue;
      }
      located.push_back(Located{rule, std::move(match)});
    }
  }

  std::vector<std::size_t> line_numbers;
  line_numbers.reserve(located.size());
  for (const auto& [rule, match] : located) {
    line_numbers.push_back(match.line_number);
  }
  auto contexts = line_numbers.empty()
      ? std::vector<std::string>{}
      : context_extractor_.extract(file.path(), line_numbers);

  std::vector<Finding> findings;
  findings.reserve(located.size());
  for (std::size_t index = 0; index < located.size(); index++) {
    auto& [rule, match] = located[index];
    findings.emplace_back(
        file.path(),
        match.line_number,
        rule->issue_type(),
        std::move(match.matched_code),
        std::move(match.detail),
        match.severity,
        rule->suggestion(),
        rule->name(),
        std::move(contexts[index]));
  }
  return findings;
}

Scanner::FileResult Scanner::scan_file(
    const std::filesystem::path& path) const {
  FileResult result;

  std::vector<std::string> lines;
  try {
    lines = reader_(path);
  } catch (const std::exception& exception) {
    ERROR(1, "Unable to read `{}`: {}", path.string(), exception.what());
    result.failures.push_back(FailedFile{path, exception.what()});
    return result;
  }

  try {
    auto file = SourceFile(path, std::move(lines));
    result.findings = analyze(file, result.failures);
  } catch (const std::exception& exception) {
    ERROR(1, "Unable to analyze `{}`: {}", path.string(), exception.what());
    result.failures.push_back(FailedFile{path, exception.what()});
  }
  return result;
}

ScanResult Scanner::scan(
    const std::filesystem::path& root,
    Statistics* TD_NULLABLE statistics) const {
  Timer collect_timer;
  LOG(1, "Collecting source files under `{}`...", root.string());
  auto candidates = collect_files(root);
  if (statistics != nullptr) {
    statistics->log_time("collect_files", collect_timer);
  }
  LOG(1,
      "Found {} source files ({} skipped) in {:.2f}s.",
      candidates.files.size(),
      candidates.skipped,
      collect_timer.duration_in_seconds());

  // One slot per file, so that the result does not depend on which worker
  // finishes first.
  std::vector<FileResult> slots(candidates.files.size());
  auto scan_slot = [&](std::size_t index) {
    Timer file_timer;
    const auto& path = candidates.files[index];
    LOG(4, "Scanning `{}`.", path.string());
    slots[index] = scan_file(path);
    if (statistics != nullptr) {
      statistics->log_file_time(path, file_timer);
    }
  };

  Timer scan_timer;
  std::size_t jobs =
      settings_.sequential ? 1 : std::max<std::size_t>(settings_.jobs, 1);
  LOG(1,
      "Scanning {} files with {} rules using {} job{}...",
      candidates.files.size(),
      rules_.size(),
      jobs,
      jobs == 1 ? "" : "s");
  if (jobs == 1 || candidates.files.size() <= 1) {
    for (std::size_t index = 0; index < candidates.files.size(); index++) {
      scan_slot(index);
    }
  } else {
    boost::asio::thread_pool pool(jobs);
    for (std::size_t index = 0; index < candidates.files.size(); index++) {
      boost::asio::post(pool, [&scan_slot, index]() { scan_slot(index); });
    }
    pool.join();
  }

  ScanResult result;
  for (auto& slot : slots) {
    result.add(std::move(slot.findings));
    for (auto& failure : slot.failures) {
      result.add_failed_file(std::move(failure));
    }
  }
  result.set_files_scanned(candidates.files.size());
  result.set_files_skipped(candidates.skipped);

  if (statistics != nullptr) {
    statistics->log_time("scan", scan_timer);
    statistics->log_jobs(jobs);
    statistics->log_files(
        result.files_scanned(),
        result.files_skipped(),
        result.failed_files().size());
    for (const auto* rule : rules_) {
      auto findings = std::count_if(
          result.findings().begin(),
          result.findings().end(),
          [rule](const Finding& finding) {
            return finding.rule_name() == rule->name();
          });
      statistics->log_findings(rule->name(), findings);
    }
  }
  LOG(1,
      "Scanned {} files in {:.2f}s: {} findings, {} failures.",
      result.files_scanned(),
      scan_timer.duration_in_seconds(),
      result.findings().size(),
      result.failed_files().size());

  return result;
}

} // namespace tracedroid
