/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tracedroid {
namespace filesystem {

/* Reads a file as an ordered list of lines. */
using LineReader =
    std::function<std::vector<std::string>(const std::filesystem::path&)>;

/* Write given str to file at path */
void save_string_file(
    const std::filesystem::path& path,
    const std::string_view str);

/**
 * Read a text file as a list of lines, without line terminators. A trailing
 * carriage return is dropped so that CRLF files match the same patterns.
 *
 * Throws `FileAccessError` if the file cannot be opened or read.
 */
std::vector<std::string> read_lines(const std::filesystem::path& path);

} // namespace filesystem
} // namespace tracedroid
