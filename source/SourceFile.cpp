/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

#include <trace-droid/SourceFile.h>

namespace tracedroid {

namespace {

enum class BlankingState {
  Code,
  BlockComment,
  TextBlock,
};

bool starts_with_at(
    const std::string& line,
    std::size_t index,
    std::string_view prefix) {
  return line.compare(index, prefix.size(), prefix) == 0;
}

void blank(std::string& line, std::size_t begin, std::size_t end) {
  for (auto index = begin; index < end && index < line.size(); index++) {
    line[index] = ' ';
  }
}

/**
 * Blank a single or character literal starting at `index` (the opening
 * quote). Returns the index after the closing quote. Unterminated literals
 * end at the end of the line.
 */
std::size_t blank_literal(
    const std::string& line,
    std::string& code,
    std::size_t index,
    char quote) {
  auto position = index + 1;
  while (position < line.size()) {
    if (line[position] == '\\') {
      blank(code, position, position + 2);
      position += 2;
    } else if (line[position] == quote) {
      return position + 1;
    } else {
      code[position] = ' ';
      position++;
    }
  }
  return line.size();
}

} // namespace

std::string_view language_to_string(Language language) {
  switch (language) {
    case Language::Kotlin:
      return "Kotlin";
    case Language::Java:
      return "Java";
    case Language::Other:
      return "Other";
  }
  return "Other";
}

Language language_from_path(const std::filesystem::path& path) {
  auto extension = path.extension().string();
  if (extension == ".kt" || extension == ".kts") {
    return Language::Kotlin;
  } else if (extension == ".java") {
    return Language::Java;
  } else {
    return Language::Other;
  }
}

SourceFile::SourceFile(
    std::filesystem::path path,
    std::vector<std::string> lines)
    : path_(std::move(path)),
      language_(language_from_path(path_)),
      lines_(std::move(lines)),
      code_lines_(blank_comments_and_literals(lines_)) {}

bool SourceFile::has_line_number(std::size_t line_number) const {
  return line_number >= 1 && line_number <= lines_.size();
}

const std::string& SourceFile::line(std::size_t line_number) const {
  if (!has_line_number(line_number)) {
    throw std::out_of_range(fmt::format(
        "Line {} is out of range for `{}` ({} lines).",
        line_number,
        path_.string(),
        lines_.size()));
  }
  return lines_[line_number - 1];
}

const std::string& SourceFile::code(std::size_t line_number) const {
  if (!has_line_number(line_number)) {
    throw std::out_of_range(fmt::format(
        "Line {} is out of range for `{}` ({} lines).",
        line_number,
        path_.string(),
        lines_.size()));
  }
  return code_lines_[line_number - 1];
}

bool SourceFile::has_path_segment(std::string_view segment) const {
  for (const auto& component : path_.parent_path()) {
    if (boost::algorithm::iequals(component.string(), segment)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> SourceFile::blank_comments_and_literals(
    const std::vector<std::string>& lines) {
  std::vector<std::string> code_lines;
  code_lines.reserve(lines.size());

  auto state = BlankingState::Code;
  for (const auto& line : lines) {
    std::string code = line;
    std::size_t index = 0;
    while (index < line.size()) {
      switch (state) {
        case BlankingState::BlockComment: {
          if (starts_with_at(line, index, "*/")) {
            blank(code, index, index + 2);
            index += 2;
            state = BlankingState::Code;
          } else {
            code[index] = ' ';
            index++;
          }
          break;
        }
        case BlankingState::TextBlock: {
          if (starts_with_at(line, index, "\"\"\"")) {
            index += 3;
            state = BlankingState::Code;
          } else {
            code[index] = ' ';
            index++;
          }
          break;
        }
        case BlankingState::Code: {
          if (starts_with_at(line, index, "//")) {
            blank(code, index, line.size());
            index = line.size();
          } else if (starts_with_at(line, index, "/*")) {
            blank(code, index, index + 2);
            index += 2;
            state = BlankingState::BlockComment;
          } else if (starts_with_at(line, index, "\"\"\"")) {
            index += 3;
            state = BlankingState::TextBlock;
          } else if (line[index] == '"' || line[index] == '\'') {
            index = blank_literal(line, code, index, line[index]);
          } else {
            index++;
          }
          break;
        }
      }
    }
    code_lines.push_back(std::move(code));
  }

  return code_lines;
}

} // namespace tracedroid
