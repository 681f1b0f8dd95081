/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <trace-droid/Errors.h>

namespace tracedroid {

ConfigurationError::ConfigurationError(const std::string& message)
    : std::invalid_argument(message) {}

DirectoryNotFoundError::DirectoryNotFoundError(
    const std::filesystem::path& path)
    : std::invalid_argument(
          fmt::format("Directory `{}` does not exist.", path.string())),
      path_(path) {}

FileAccessError::FileAccessError(
    const std::filesystem::path& path,
    const std::string& reason)
    : std::runtime_error(
          fmt::format("Could not read `{}`: {}", path.string(), reason)),
      path_(path) {}

RuleEvaluationError::RuleEvaluationError(const std::string& message)
    : std::runtime_error(message) {}

} // namespace tracedroid
