/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <trace-droid/JsonReaderWriter.h>
#include <trace-droid/JsonValidation.h>

namespace tracedroid {

namespace {

std::string invalid_argument_message(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected) {
  auto field_information = field ? fmt::format(" for field `{}`", *field) : "";
  return fmt::format(
      "Error validating `{}`. Expected {}{}.",
      boost::algorithm::trim_copy(JsonWriter::to_styled_string(value)),
      expected,
      field_information);
}

} // namespace

JsonValidationError::JsonValidationError(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected)
    : std::invalid_argument(invalid_argument_message(value, field, expected)) {}

void JsonValidation::validate_object(
    const Json::Value& value,
    const std::string& expected) {
  if (value.isNull() || !value.isObject()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ expected);
  }
}

void JsonValidation::validate_object(const Json::Value& value) {
  validate_object(value, /* expected */ "non-null object");
}

std::string JsonValidation::string(const Json::Value& value) {
  if (value.isNull() || !value.isString()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ "string");
  }
  return value.asString();
}

std::string JsonValidation::string(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with string field `{}`", field));
  const auto& string = value[field];
  if (string.isNull() || !string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

std::optional<std::string> JsonValidation::optional_string(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with string field `{}`", field));
  const auto& string = value[field];
  if (string.isNull()) {
    return std::nullopt;
  }
  if (!string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

std::uint32_t JsonValidation::unsigned_integer(const Json::Value& value) {
  if (value.isNull() || !value.isUInt()) {
    throw JsonValidationError(
        value,
        /* field */ std::nullopt,
        /* expected */ "unsigned integer (32-bit)");
  }
  return value.asUInt();
}

std::optional<std::uint32_t> JsonValidation::optional_unsigned_integer(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value,
      fmt::format("non-null object with unsigned integer field `{}`", field));
  const auto& integer = value[field];
  if (integer.isNull()) {
    return std::nullopt;
  }
  if (!integer.isUInt()) {
    throw JsonValidationError(value, field, /* expected */ "unsigned integer");
  }
  return integer.asUInt();
}

bool JsonValidation::optional_boolean(
    const Json::Value& value,
    const std::string& field,
    bool default_value) {
  validate_object(
      value, fmt::format("non-null object with boolean field `{}`", field));
  const auto& boolean = value[field];
  if (boolean.isNull()) {
    return default_value;
  }
  if (!boolean.isBool()) {
    throw JsonValidationError(value, field, /* expected */ "boolean");
  }
  return boolean.asBool();
}

const Json::Value& JsonValidation::null_or_array(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value,
      fmt::format("non-null object with null or array field `{}`", field));
  if (!value.isMember(field)) {
    return Json::Value::nullSingleton();
  }
  const auto& null_or_array = value[field];
  if (!null_or_array.isNull() && !null_or_array.isArray()) {
    throw JsonValidationError(value, field, /* expected */ "null or array");
  }
  return null_or_array;
}

const Json::Value& JsonValidation::null_or_object(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value,
      fmt::format("non-null object with null or object field `{}`", field));
  if (!value.isMember(field)) {
    return Json::Value::nullSingleton();
  }
  const auto& attribute = value[field];
  if (!attribute.isNull() && !attribute.isObject()) {
    throw JsonValidationError(value, field, /* expected */ "null or object");
  }
  return attribute;
}

std::optional<std::vector<std::string>> JsonValidation::optional_string_list(
    const Json::Value& value,
    const std::string& field) {
  const auto& array = null_or_array(value, field);
  if (array.isNull()) {
    return std::nullopt;
  }
  std::vector<std::string> strings;
  for (const auto& element : array) {
    strings.push_back(JsonValidation::string(element));
  }
  return strings;
}

void JsonValidation::update_object(
    Json::Value& left,
    const Json::Value& right) {
  validate_object(left);
  validate_object(right);
  for (const auto& key : right.getMemberNames()) {
    left[key] = right[key];
  }
}

void JsonValidation::check_unexpected_members(
    const Json::Value& value,
    const std::unordered_set<std::string>& valid_members) {
  validate_object(value);
  // Sorted so that the error message is stable.
  std::vector<std::string> sorted_members(
      valid_members.begin(), valid_members.end());
  std::sort(sorted_members.begin(), sorted_members.end());
  for (const std::string& member : value.getMemberNames()) {
    if (valid_members.find(member) == valid_members.end()) {
      std::vector<std::string> quoted;
      for (const auto& valid_member : sorted_members) {
        quoted.push_back(fmt::format("`{}`", valid_member));
      }
      throw JsonValidationError(
          value,
          /* field */ std::nullopt,
          /* expected */
          fmt::format(
              "fields {}, got `{}`", fmt::join(quoted, ", "), member));
    }
  }
}

} // namespace tracedroid
