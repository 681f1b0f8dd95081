/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/WebViewJavascriptRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_javascript_interface(R"(\baddJavascriptInterface\s*\()");

const re2::RE2 k_javascript_enabled(
    R"(\bsetJavaScriptEnabled\s*\(\s*true\s*\)|\bjavaScriptEnabled\s*=\s*true\b)");

const re2::RE2 k_load_url(R"(\bloadUrl\s*\()");

// A single literal argument, on the code view.
const re2::RE2 k_literal_argument(R"(^\(\s*"[^"]*"\s*\)$)");

} // namespace

WebViewJavascriptRule::WebViewJavascriptRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "webview-javascript",
          /* code */ 6001,
          /* issue_type */ "Insecure WebView Configuration",
          /* suggestion */
          "Only enable JavaScript and JavaScript interfaces for trusted, constant URLs.",
          /* languages */ {Language::Kotlin, Language::Java}),
      statement_max_lines_(heuristics.statement_max_lines()) {}

std::vector<RuleMatch> WebViewJavascriptRule::analyze(
    const SourceFile& file) const {
  bool loads_dynamic_url = false;
  for (std::size_t line = 1; line <= file.size() && !loads_dynamic_url;
       line++) {
    for (auto column : find_columns(file.code(line), k_load_url)) {
      auto call =
          scanning::accumulate_call(file, line, column, statement_max_lines_);
      if (call &&
          (!re2::RE2::FullMatch(call->code, k_literal_argument) ||
           call->text.find('$') != std::string::npos)) {
        loads_dynamic_url = true;
        break;
      }
    }
  }

  std::vector<RuleMatch> matches;
  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    if (re2::RE2::PartialMatch(code, k_javascript_interface)) {
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          "A JavaScript interface exposes Java methods to every page loaded in the WebView."));
    } else if (
        loads_dynamic_url &&
        re2::RE2::PartialMatch(code, k_javascript_enabled)) {
      matches.push_back(match(
          file,
          line,
          Severity::Low,
          "JavaScript is enabled in a WebView that loads a non-constant URL."));
    }
  }

  return matches;
}

} // namespace tracedroid
