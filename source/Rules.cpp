/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>

#include <trace-droid/Errors.h>
#include <trace-droid/JsonReaderWriter.h>
#include <trace-droid/Log.h>
#include <trace-droid/Options.h>
#include <trace-droid/Rules.h>
#include <trace-droid/rules/BuiltinRules.h>

namespace tracedroid {

Rules::Rules(std::vector<std::unique_ptr<Rule>> rules) {
  for (auto& rule : rules) {
    add(std::move(rule));
  }
}

Rules Rules::load(const Options& options) {
  return select(
      make_builtin_rules(options.heuristics()),
      options.enabled_rules(),
      options.disabled_rules());
}

Rules Rules::select(
    std::vector<std::unique_ptr<Rule>> rules,
    const std::optional<std::vector<std::string>>& enabled,
    const std::vector<std::string>& disabled) {
  std::unordered_set<std::string> known;
  for (const auto& rule : rules) {
    known.insert(rule->name());
  }

  auto check_known = [&](const std::vector<std::string>& names) {
    for (const auto& name : names) {
      if (known.count(name) == 0) {
        throw ConfigurationError(fmt::format("Unknown rule `{}`.", name));
      }
    }
  };
  if (enabled) {
    check_known(*enabled);
  }
  check_known(disabled);

  Rules selected;
  for (auto& rule : rules) {
    const auto& name = rule->name();
    if (enabled &&
        std::find(enabled->begin(), enabled->end(), name) == enabled->end()) {
      LOG(3, "Rule `{}` is not enabled.", name);
      continue;
    }
    if (std::find(disabled.begin(), disabled.end(), name) != disabled.end()) {
      LOG(3, "Rule `{}` is disabled.", name);
      continue;
    }
    selected.add(std::move(rule));
  }
  return selected;
}

void Rules::add(std::unique_ptr<Rule> rule) {
  auto existing = std::find_if(
      rules_.begin(), rules_.end(), [&](const std::unique_ptr<Rule>& other) {
        return other->code() == rule->code() || other->name() == rule->name();
      });
  if (existing != rules_.end()) {
    ERROR(
        1,
        "A rule for code {} or name `{}` already exists! Duplicate rules are:\n{}\n{}",
        rule->code(),
        rule->name(),
        JsonWriter::to_styled_string(rule->to_json()),
        JsonWriter::to_styled_string((*existing)->to_json()));
    throw ConfigurationError(fmt::format(
        "Duplicate rule `{}` (code {}).", rule->name(), rule->code()));
  }

  rules_.push_back(std::move(rule));
}

const Rule* TD_NULLABLE Rules::find(const std::string& name) const {
  auto found = std::find_if(
      rules_.begin(), rules_.end(), [&](const std::unique_ptr<Rule>& rule) {
        return rule->name() == name;
      });
  return found != rules_.end() ? found->get() : nullptr;
}

} // namespace tracedroid
