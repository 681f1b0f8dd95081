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
#include <vector>

#include <trace-droid/Filesystem.h>

namespace tracedroid {

constexpr std::size_t k_default_context_lines = 10;

/**
 * Renders the lines around a finding for human readers.
 *
 * The file is read again through the given reader rather than kept from the
 * scan. Safe to call from several threads as long as the reader is.
 */
class ContextExtractor final {
 public:
  explicit ContextExtractor(
      filesystem::LineReader reader,
      std::size_t window = k_default_context_lines);

  std::size_t window() const {
    return window_;
  }

  /**
   * Render the context of `line_number` in the given file. If the file cannot
   * be read, returns a short diagnostic instead of throwing.
   */
  std::string extract(
      const std::filesystem::path& path,
      std::size_t line_number) const;

  /* Same as above for several lines of one file, reading it once. */
  std::vector<std::string> extract(
      const std::filesystem::path& path,
      const std::vector<std::size_t>& line_numbers) const;

  /**
   * Render `[line_number - window, line_number + window]`, clipped to
   * `[1, lines.size()]`. Every line is prefixed by its number, the target
   * line by a `>>` marker:
   * ```
   *     9 |   val x: String? = null
   * >> 10 |   x.length()
   * ```
   */
  static std::string render(
      const std::vector<std::string>& lines,
      std::size_t line_number,
      std::size_t window);

 private:
  filesystem::LineReader reader_;
  std::size_t window_;
};

} // namespace tracedroid
