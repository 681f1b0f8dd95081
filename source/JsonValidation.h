/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <json/json.h>

namespace tracedroid {

class JsonValidationError : public std::invalid_argument {
 public:
  JsonValidationError(
      const Json::Value& value,
      const std::optional<std::string>& field,
      const std::string& expected);
};

class JsonValidation final {
 public:
  static void validate_object(const Json::Value& value);
  static void validate_object(
      const Json::Value& value,
      const std::string& expected);

  static std::string string(const Json::Value& value);
  static std::string string(const Json::Value& value, const std::string& field);
  static std::optional<std::string> optional_string(
      const Json::Value& value,
      const std::string& field);

  static std::uint32_t unsigned_integer(const Json::Value& value);
  static std::optional<std::uint32_t> optional_unsigned_integer(
      const Json::Value& value,
      const std::string& field);

  static bool optional_boolean(
      const Json::Value& value,
      const std::string& field,
      bool default_value);

  static const Json::Value& null_or_array(
      const Json::Value& value,
      const std::string& field);

  static const Json::Value& null_or_object(
      const Json::Value& value,
      const std::string& field);

  /* Read an optional array of strings, returning nullopt when absent. */
  static std::optional<std::vector<std::string>> optional_string_list(
      const Json::Value& value,
      const std::string& field);

  /**
   * Add (key, value) pairs from the given `right` object into the given `left`
   * object, in place.
   */
  static void update_object(Json::Value& left, const Json::Value& right);

  /* Error on invalid members of a json object. */
  static void check_unexpected_members(
      const Json::Value& value,
      const std::unordered_set<std::string>& valid_members);
};

} // namespace tracedroid
