/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/rules/ReceiverRegistrationRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_register(R"(\bregisterReceiver\s*\()");
const re2::RE2 k_unregister(R"(\bunregisterReceiver\s*\()");

} // namespace

ReceiverRegistrationRule::ReceiverRegistrationRule(
    const Heuristics& /* heuristics */)
    : Rule(
          /* name */ "receiver-registration",
          /* code */ 5001,
          /* issue_type */ "Unbalanced Receiver Registration",
          /* suggestion */
          "Unregister the receiver in the matching lifecycle callback (`onPause`, `onStop` or `onDestroy`).",
          /* languages */ {Language::Kotlin, Language::Java}) {}

std::vector<RuleMatch> ReceiverRegistrationRule::analyze(
    const SourceFile& file) const {
  if (file.size() == 0 ||
      scanning::block_contains(
          file, scanning::Block{1, file.size()}, k_unregister)) {
    return {};
  }

  std::vector<RuleMatch> matches;
  for (std::size_t line = 1; line <= file.size(); line++) {
    if (re2::RE2::PartialMatch(file.code(line), k_register)) {
      matches.push_back(match(
          file,
          line,
          Severity::Medium,
          "A receiver is registered but never unregistered in this file."));
    }
  }
  return matches;
}

} // namespace tracedroid
