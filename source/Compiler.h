// (c) Facebook, Inc. and its affiliates. Confidential and proprietary.

#pragma once

// This file is mostly based on folly/CppAttributes.h

#ifndef __has_extension
#define TD_HAS_EXTENSION(x) 0
#else
#define TD_HAS_EXTENSION(x) __has_extension(x)
#endif

#if defined(__GNUC__) || defined(__clang__)
#define TD_PUSH_WARNING _Pragma("GCC diagnostic push")
#define TD_POP_WARNING _Pragma("GCC diagnostic pop")
#define TD_GNU_DISABLE_WARNING_INTERNAL2(warningName) #warningName
#define TD_GNU_DISABLE_WARNING(warningName) \
  _Pragma(TD_GNU_DISABLE_WARNING_INTERNAL2(GCC diagnostic ignored warningName))
#ifdef __clang__
#define TD_CLANG_DISABLE_WARNING(warningName) \
  TD_GNU_DISABLE_WARNING(warningName)
#else
#define TD_CLANG_DISABLE_WARNING(warningName)
#endif
#else
#define TD_PUSH_WARNING
#define TD_POP_WARNING
#define TD_GNU_DISABLE_WARNING(warningName)
#define TD_CLANG_DISABLE_WARNING(warningName)
#endif

/**
 * Nullable indicates that a return value or a parameter may be a `nullptr`,
 * e.g.
 *
 * const Rule* TD_NULLABLE find(const std::string& name) const;
 *
 * Ignores Clang's -Wnullability-extension since it correctly handles the case
 * where the extension is not present.
 */
#if TD_HAS_EXTENSION(nullability)
#define TD_NULLABLE                                   \
  TD_PUSH_WARNING                                     \
  TD_CLANG_DISABLE_WARNING("-Wnullability-extension") \
  _Nullable TD_POP_WARNING
#else
#define TD_NULLABLE
#endif
