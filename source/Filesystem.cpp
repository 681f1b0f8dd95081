/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cerrno>
#include <cstring>
#include <fstream>

#include <trace-droid/Errors.h>
#include <trace-droid/Filesystem.h>
#include <trace-droid/Log.h>

namespace tracedroid {
namespace filesystem {

void save_string_file(
    const std::filesystem::path& path,
    const std::string_view str) {
  std::ofstream file;
  file.exceptions(std::ios_base::failbit | std::ios_base::badbit);
  file.open(path, std::ios_base::binary);
  file.write(str.data(), str.size());
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
  std::ifstream file;
  file.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  try {
    file.open(path, std::ios_base::binary);
  } catch (const std::ifstream::failure&) {
    ERROR(1, "Could not open file: `{}`.", path.string());
    throw FileAccessError(path, std::strerror(errno));
  }

  std::vector<std::string> lines;
  std::string line;
  try {
    while (std::getline(file, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      lines.push_back(line);
    }
  } catch (const std::ifstream::failure&) {
    if (!file.eof()) {
      ERROR(1, "Error reading file: `{}`.", path.string());
      throw FileAccessError(path, "read error");
    }
  }

  return lines;
}

} // namespace filesystem
} // namespace tracedroid
