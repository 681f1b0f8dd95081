/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cmath>

#include <trace-droid/Statistics.h>

namespace tracedroid {

void Statistics::log_jobs(std::size_t jobs) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_ = jobs;
}

void Statistics::log_files(
    std::size_t scanned,
    std::size_t skipped,
    std::size_t failed) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_scanned_ = scanned;
  files_skipped_ = skipped;
  files_failed_ = failed;
}

void Statistics::log_findings(
    const std::string& rule_name,
    std::size_t findings) {
  std::lock_guard<std::mutex> lock(mutex_);
  findings_[rule_name] += findings;
}

void Statistics::log_time(const std::string& name, const Timer& timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  times_[name] = timer.duration_in_seconds();
}

void Statistics::log_file_time(
    const std::filesystem::path& file,
    const Timer& timer) {
  double duration_in_seconds = timer.duration_in_seconds();

  std::lock_guard<std::mutex> lock(mutex_);

  if (slowest_files_.size() >= Statistics::kRecordSlowestFiles &&
      slowest_files_.back().second > duration_in_seconds) {
    return;
  }

  auto found = std::find_if(
      slowest_files_.begin(),
      slowest_files_.end(),
      [&](const auto& record) { return record.first == file; });
  if (found != slowest_files_.end()) {
    slowest_files_.erase(found);
  } else if (slowest_files_.size() >= Statistics::kRecordSlowestFiles) {
    slowest_files_.pop_back();
  }

  auto record = std::make_pair(file, duration_in_seconds);
  slowest_files_.insert(
      std::upper_bound(
          slowest_files_.begin(),
          slowest_files_.end(),
          record,
          [](const auto& left, const auto& right) {
            return left.second > right.second;
          }),
      record);
}

namespace {

double round(double x, int digits) {
  double y = std::pow(10, digits);
  return std::round(x * y) / y;
}

} // namespace

Json::Value Statistics::to_json() const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto value = Json::Value(Json::objectValue);
  value["jobs"] = Json::Value(static_cast<Json::Int64>(jobs_));

  auto files_value = Json::Value(Json::objectValue);
  files_value["scanned"] =
      Json::Value(static_cast<Json::Int64>(files_scanned_));
  files_value["skipped"] =
      Json::Value(static_cast<Json::Int64>(files_skipped_));
  files_value["failed"] =
      Json::Value(static_cast<Json::Int64>(files_failed_));
  value["files"] = files_value;

  auto findings_value = Json::Value(Json::objectValue);
  for (const auto& [rule_name, findings] : findings_) {
    findings_value[rule_name] =
        Json::Value(static_cast<Json::Int64>(findings));
  }
  value["findings"] = findings_value;

  auto times_value = Json::Value(Json::objectValue);
  for (const auto& record : times_) {
    times_value[record.first] = Json::Value(round(record.second, 3));
  }
  value["times"] = times_value;

  auto slowest_files_value = Json::Value(Json::arrayValue);
  for (const auto& record : slowest_files_) {
    auto slow_file_value = Json::Value(Json::arrayValue);
    slow_file_value.append(Json::Value(record.first.string()));
    slow_file_value.append(Json::Value(round(record.second, 3)));
    slowest_files_value.append(slow_file_value);
  }
  value["slowest_files"] = slowest_files_value;

  return value;
}

} // namespace tracedroid
