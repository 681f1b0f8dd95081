/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <trace-droid/IncludeMacros.h>

namespace tracedroid {

enum class Language {
  Kotlin,
  Java,
  Other,
};

std::string_view language_to_string(Language language);

Language language_from_path(const std::filesystem::path& path);

/**
 * The lines of one source file, as seen by the rules.
 *
 * Line numbers are 1-based. Next to every raw line, the file keeps a "code"
 * line of the same length in which comments and the contents of string and
 * character literals are replaced by spaces. Quotes are kept, so a literal
 * stays recognizable. Guards and braces should be matched against the code
 * lines; the raw lines are what gets reported.
 */
class SourceFile final {
 public:
  explicit SourceFile(
      std::filesystem::path path,
      std::vector<std::string> lines);

  MOVE_CONSTRUCTOR_ONLY(SourceFile)

  const std::filesystem::path& path() const {
    return path_;
  }

  Language language() const {
    return language_;
  }

  /* Number of lines in the file. */
  std::size_t size() const {
    return lines_.size();
  }

  bool has_line_number(std::size_t line_number) const;

  /* Raw text of the given line. Throws `std::out_of_range`. */
  const std::string& line(std::size_t line_number) const;

  /* Blanked text of the given line. Throws `std::out_of_range`. */
  const std::string& code(std::size_t line_number) const;

  const std::vector<std::string>& lines() const {
    return lines_;
  }

  /**
   * Returns true if one of the directories in the path is `segment`, ignoring
   * case.
   */
  bool has_path_segment(std::string_view segment) const;

  /**
   * Replace comments and the contents of literals by spaces. Block comments
   * and Kotlin/Java text blocks (`"""`) may span several lines.
   */
  static std::vector<std::string> blank_comments_and_literals(
      const std::vector<std::string>& lines);

 private:
  std::filesystem::path path_;
  Language language_;
  std::vector<std::string> lines_;
  std::vector<std::string> code_lines_;
};

} // namespace tracedroid
