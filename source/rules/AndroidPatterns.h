/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/SourceFile.h>

namespace tracedroid {

/**
 * Lifecycle and UI callbacks that run on the main thread: `onCreate`,
 * `onStart`, `onResume`, `onClick`, `onViewCreated`, `onCreateView`.
 */
bool is_main_thread_method(const std::string& method_name);

/* Lifecycle callbacks run during teardown, such as `onDestroy`. */
bool is_teardown_method(const std::string& method_name);

/**
 * Calls that start an asynchronous callback: `enqueue`, `onResponse`,
 * `subscribe`, `postDelayed`, `launch`, `observe`, `addOnSuccessListener`...
 */
const re2::RE2& async_callback_pattern();

/**
 * Search the `lookback` lines before `line_number` for the start of an
 * asynchronous callback whose block contains `line_number`. Returns the block.
 */
std::optional<scanning::Block> enclosing_async_callback(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t lookback);

} // namespace tracedroid
