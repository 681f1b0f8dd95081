/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>

#include <trace-droid/ListingCommands.h>

namespace tracedroid {

void ListingCommands::list_all_rules(const Rules& rules, std::ostream& output) {
  output << "=== All Rules ===" << std::endl;

  for (const auto* rule : rules) {
    std::vector<std::string> languages;
    for (auto language : rule->languages()) {
      languages.emplace_back(language_to_string(language));
    }

    output << fmt::format("Rule: {}", rule->name()) << std::endl;
    output << fmt::format("  Code: {}", rule->code()) << std::endl;
    output << fmt::format("  Issue type: {}", rule->issue_type()) << std::endl;
    output << fmt::format(
                  "  Languages: {}", boost::algorithm::join(languages, ", "))
           << std::endl;
    output << fmt::format("  Suggestion: {}", rule->suggestion()) << std::endl;
  }
}

} // namespace tracedroid
