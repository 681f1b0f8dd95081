/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/iterator/transform_iterator.hpp>

#include <trace-droid/Compiler.h>
#include <trace-droid/IncludeMacros.h>
#include <trace-droid/Rule.h>

namespace tracedroid {

class Options;

/**
 * The ordered set of active rules. Names and codes are unique. Rules run in
 * the order they were added.
 */
class Rules final {
 private:
  struct ExposeRulePointer {
    const Rule* operator()(const std::unique_ptr<Rule>& rule) const {
      return rule.get();
    }
  };

 public:
  // C++ container concept member types
  using iterator = boost::transform_iterator<
      ExposeRulePointer,
      std::vector<std::unique_ptr<Rule>>::const_iterator>;
  using const_iterator = iterator;
  using value_type = const Rule*;
  using difference_type = std::ptrdiff_t;
  using size_type = std::size_t;
  using const_reference = const Rule*;
  using const_pointer = typename iterator::pointer;

 private:
  // Safety checks of `boost::transform_iterator`.
  static_assert(std::is_same_v<typename iterator::value_type, value_type>);
  static_assert(
      std::is_same_v<typename iterator::difference_type, difference_type>);
  static_assert(std::is_same_v<typename iterator::reference, const_reference>);

 public:
  Rules() = default;

  explicit Rules(std::vector<std::unique_ptr<Rule>> rules);

  /**
   * Build the built-in rules with the heuristics of the given options, then
   * keep the enabled ones and remove the disabled ones.
   */
  static Rules load(const Options& options);

  /**
   * Keep the rules named in `enabled` (all of them if absent), minus the ones
   * named in `disabled`. Throws `ConfigurationError` on an unknown name.
   */
  static Rules select(
      std::vector<std::unique_ptr<Rule>> rules,
      const std::optional<std::vector<std::string>>& enabled,
      const std::vector<std::string>& disabled);

  MOVE_CONSTRUCTOR_ONLY(Rules);

  /**
   * Add a rule at the end. Throws `ConfigurationError` if a rule with the same
   * name or code is already present.
   */
  void add(std::unique_ptr<Rule> rule);

  const Rule* TD_NULLABLE find(const std::string& name) const;

  std::size_t size() const {
    return rules_.size();
  }

  bool empty() const {
    return rules_.empty();
  }

  iterator begin() const {
    return boost::make_transform_iterator(rules_.cbegin(), ExposeRulePointer());
  }

  iterator end() const {
    return boost::make_transform_iterator(rules_.cend(), ExposeRulePointer());
  }

 private:
  std::vector<std::unique_ptr<Rule>> rules_;
};

} // namespace tracedroid
