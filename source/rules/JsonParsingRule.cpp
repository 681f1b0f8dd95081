/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <optional>

#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/JsonParsingRule.h>

namespace tracedroid {

namespace {

// Each pattern captures the name of the call.
const re2::RE2 k_constructor(R"(\b(JSONObject|JSONArray)\s*\(\s*[^)\s])");
const re2::RE2 k_nested_lookup(R"(\.\s*(getJSONObject|getJSONArray)\s*\()");
const re2::RE2 k_value_lookup(
    R"(\b\w*(?:json|Json|JSON|obj|Obj)\w*\s*\.\s*(getString|getInt|getLong|getDouble|getBoolean)\s*\()");
const re2::RE2 k_gson(R"(\.\s*(fromJson)\s*\()");

const re2::RE2 k_try(R"(\btry\b|\brunCatching\b)");

} // namespace

JsonParsingRule::JsonParsingRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "json-parsing",
          /* code */ 3001,
          /* issue_type */ "Unguarded JSON Parsing",
          /* suggestion */
          "Wrap JSON parsing in a try/catch for `JSONException` (or `JsonSyntaxException`), or use the `opt*` accessors.",
          /* languages */ {Language::Kotlin, Language::Java}),
      method_search_limit_(heuristics.method_search_limit()) {}

std::vector<RuleMatch> JsonParsingRule::analyze(const SourceFile& file) const {
  std::vector<RuleMatch> matches;
  auto covered = scanning::try_coverage(file);

  for (std::size_t line = 1; line <= file.size(); line++) {
    if (covered[line]) {
      continue;
    }
    const auto& code = file.code(line);

    std::optional<std::string> call;
    for (const auto* pattern :
         {&k_constructor, &k_nested_lookup, &k_value_lookup, &k_gson}) {
      if ((call = first_capture(code, *pattern))) {
        break;
      }
    }
    if (!call) {
      continue;
    }

    auto severity = Severity::High;
    if (auto method =
            scanning::find_enclosing_method(file, line, method_search_limit_)) {
      if (scanning::method_contains(file, *method, k_try)) {
        severity = Severity::Medium;
      }
    }
    matches.push_back(match(
        file,
        line,
        severity,
        fmt::format(
            "`{}` throws on malformed JSON and is not inside a try block.",
            *call)));
  }

  return matches;
}

} // namespace tracedroid
