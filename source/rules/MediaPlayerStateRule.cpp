/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <map>
#include <unordered_map>
#include <unordered_set>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <re2/re2.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/RE2.h>
#include <trace-droid/rules/MediaPlayerStateRule.h>

namespace tracedroid {

namespace {

const re2::RE2 k_kotlin_declaration(
    R"(\b(?:val|var)\s+(\w+)(?:\s*:\s*MediaPlayer\??)?\s*=\s*MediaPlayer\b)");

const re2::RE2 k_kotlin_typed(R"(\b(\w+)\s*:\s*MediaPlayer\b)");

const re2::RE2 k_java_declaration(R"(\bMediaPlayer\s+(\w+)\b)");

const re2::RE2 k_call(R"(\b(\w+)\s*(?:\?|!!)?\.\s*(\w+)\s*\()");

const re2::RE2 k_assignment(R"(\b(\w+)\s*=[^=])");

const re2::RE2 k_preparation(
    R"(\.\s*prepare(?:Async)?\s*\(|\bMediaPlayer\s*\.\s*create\s*\()");

struct PlayerState {
  bool prepared_asynchronously = false;
  bool released = false;
  std::size_t release_line = 0;
};

struct MethodState {
  scanning::Method method;
  bool has_preparation;
  std::unordered_map<std::string, PlayerState> players;
};

} // namespace

MediaPlayerStateRule::MediaPlayerStateRule(const Heuristics& heuristics)
    : Rule(
          /* name */ "media-player-state",
          /* code */ 5000,
          /* issue_type */ "Incorrect State Machine",
          /* suggestion */
          "Follow the MediaPlayer state machine: prepare before `start()`, wait for `onPrepared` after `prepareAsync()`, and never use the player after `release()`.",
          /* languages */ {Language::Kotlin, Language::Java}),
      method_search_limit_(heuristics.method_search_limit()) {}

std::vector<RuleMatch> MediaPlayerStateRule::analyze(
    const SourceFile& file) const {
  std::unordered_set<std::string> players;
  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);
    for (const auto* pattern :
         {&k_kotlin_declaration, &k_kotlin_typed, &k_java_declaration}) {
      for (auto& name : all_captures(code, *pattern)) {
        players.insert(std::move(name));
      }
    }
  }
  auto is_player = [&](const std::string& name) {
    return players.count(name) > 0 ||
        boost::algorithm::icontains(name, "player");
  };

  std::vector<RuleMatch> matches;
  // Keyed by the line of the method declaration.
  std::map<std::size_t, MethodState> methods;

  for (std::size_t line = 1; line <= file.size(); line++) {
    const auto& code = file.code(line);

    // Reassigning a player gives a fresh instance.
    for (const auto& assigned : all_captures(code, k_assignment)) {
      for (auto& entry : methods) {
        auto& state = entry.second;
        auto found = state.players.find(assigned);
        if (found != state.players.end() && state.method.contains(line)) {
          found->second = PlayerState();
        }
      }
    }

    re2::StringPiece input(code);
    std::string receiver;
    std::string operation;
    while (re2::RE2::FindAndConsume(&input, k_call, &receiver, &operation)) {
      if (!is_player(receiver)) {
        continue;
      }
      auto method =
          scanning::find_enclosing_method(file, line, method_search_limit_);
      if (!method) {
        break;
      }
      auto found = methods.find(method->declaration);
      if (found == methods.end()) {
        bool has_preparation =
            scanning::method_contains(file, *method, k_preparation);
        found = methods
                    .emplace(
                        method->declaration,
                        MethodState{*method, has_preparation, {}})
                    .first;
      }
      auto& state = found->second;
      auto& player = state.players[receiver];

      if (player.released && operation != "release") {
        matches.push_back(match(
            file,
            line,
            Severity::High,
            fmt::format(
                "`{}.{}()` is called after `{}.release()` at line {}.",
                receiver,
                operation,
                receiver,
                player.release_line)));
        continue;
      }

      if (operation == "release") {
        player.released = true;
        player.release_line = line;
      } else if (operation == "prepareAsync") {
        player.prepared_asynchronously = true;
      } else if (operation == "start") {
        evaluate_occurrence(file, line, [&]() {
          re2::RE2 listener(fmt::format(
              R"({}\s*(?:\?|!!)?\.\s*setOnPreparedListener\b)",
              word(receiver)));
          if (player.prepared_asynchronously &&
              !scanning::method_contains(
                  file, state.method, checked(listener))) {
            matches.push_back(match(
                file,
                line,
                Severity::High,
                fmt::format(
                    "`{}.start()` is called right after `prepareAsync()`, before the player is prepared.",
                    receiver)));
          } else if (!state.has_preparation) {
            matches.push_back(match(
                file,
                line,
                Severity::Medium,
                fmt::format(
                    "`{}.start()` is called in `{}`, which never prepares the player.",
                    receiver,
                    state.method.name)));
          }
        });
      }
    }
  }

  return matches;
}

} // namespace tracedroid
