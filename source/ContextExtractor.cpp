/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <exception>

#include <fmt/format.h>

#include <trace-droid/ContextExtractor.h>
#include <trace-droid/Log.h>

namespace tracedroid {

namespace {

std::string unavailable(const std::string& reason) {
  return fmt::format("<context unavailable: {}>", reason);
}

} // namespace

ContextExtractor::ContextExtractor(
    filesystem::LineReader reader,
    std::size_t window)
    : reader_(std::move(reader)), window_(window) {}

std::string ContextExtractor::extract(
    const std::filesystem::path& path,
    std::size_t line_number) const {
  return extract(path, std::vector<std::size_t>{line_number}).front();
}

std::vector<std::string> ContextExtractor::extract(
    const std::filesystem::path& path,
    const std::vector<std::size_t>& line_numbers) const {
  std::vector<std::string> lines;
  try {
    lines = reader_(path);
  } catch (const std::exception& error) {
    WARNING(
        1,
        "Unable to extract context from `{}`: {}",
        path.string(),
        error.what());
    return std::vector<std::string>(
        line_numbers.size(), unavailable(error.what()));
  }

  std::vector<std::string> contexts;
  contexts.reserve(line_numbers.size());
  for (auto line_number : line_numbers) {
    if (line_number < 1 || line_number > lines.size()) {
      contexts.push_back(unavailable(fmt::format(
          "line {} is out of range ({} lines)", line_number, lines.size())));
    } else {
      contexts.push_back(render(lines, line_number, window_));
    }
  }
  return contexts;
}

std::string ContextExtractor::render(
    const std::vector<std::string>& lines,
    std::size_t line_number,
    std::size_t window) {
  if (lines.empty() || line_number < 1 || line_number > lines.size()) {
    return "";
  }

  auto first = line_number > window ? line_number - window : 1;
  auto last = std::min(lines.size(), line_number + window);
  auto width = std::to_string(last).size();

  std::string context;
  for (auto current = first; current <= last; current++) {
    if (current != first) {
      context += '\n';
    }
    context += fmt::format(
        "{} {:>{}} | {}",
        current == line_number ? ">>" : "  ",
        current,
        width,
        lines[current - 1]);
  }
  return context;
}

} // namespace tracedroid
