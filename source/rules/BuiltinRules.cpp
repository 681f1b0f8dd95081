/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <trace-droid/rules/BuiltinRules.h>
#include <trace-droid/rules/CollectionAccessRule.h>
#include <trace-droid/rules/ConcurrentModificationRule.h>
#include <trace-droid/rules/CursorAccessRule.h>
#include <trace-droid/rules/CursorLeakRule.h>
#include <trace-droid/rules/DialogShowRule.h>
#include <trace-droid/rules/DivisionBySizeRule.h>
#include <trace-droid/rules/FragmentCommitRule.h>
#include <trace-droid/rules/FragmentContextRule.h>
#include <trace-droid/rules/GlobalScopeRule.h>
#include <trace-droid/rules/IntentExtraRule.h>
#include <trace-droid/rules/JsonParsingRule.h>
#include <trace-droid/rules/LateinitAccessRule.h>
#include <trace-droid/rules/MainThreadNetworkRule.h>
#include <trace-droid/rules/MediaPlayerStateRule.h>
#include <trace-droid/rules/NonNullAssertionRule.h>
#include <trace-droid/rules/NullGuardRule.h>
#include <trace-droid/rules/NumberFormatRule.h>
#include <trace-droid/rules/ReceiverRegistrationRule.h>
#include <trace-droid/rules/ResponseBodyRule.h>
#include <trace-droid/rules/SplitIndexRule.h>
#include <trace-droid/rules/SqlInjectionRule.h>
#include <trace-droid/rules/SwallowedExceptionRule.h>
#include <trace-droid/rules/UnguardedIoRule.h>
#include <trace-droid/rules/UnsafeCastRule.h>
#include <trace-droid/rules/WebViewJavascriptRule.h>

namespace tracedroid {

std::vector<std::unique_ptr<Rule>> make_builtin_rules(
    const Heuristics& heuristics) {
  std::vector<std::unique_ptr<Rule>> rules;
  rules.push_back(std::make_unique<NullGuardRule>(heuristics));
  rules.push_back(std::make_unique<NonNullAssertionRule>(heuristics));
  rules.push_back(std::make_unique<LateinitAccessRule>(heuristics));
  rules.push_back(std::make_unique<UnsafeCastRule>(heuristics));
  rules.push_back(std::make_unique<IntentExtraRule>(heuristics));
  rules.push_back(std::make_unique<CollectionAccessRule>(heuristics));
  rules.push_back(std::make_unique<SplitIndexRule>(heuristics));
  rules.push_back(std::make_unique<ConcurrentModificationRule>(heuristics));
  rules.push_back(std::make_unique<DivisionBySizeRule>(heuristics));
  rules.push_back(std::make_unique<NumberFormatRule>(heuristics));
  rules.push_back(std::make_unique<JsonParsingRule>(heuristics));
  rules.push_back(std::make_unique<UnguardedIoRule>(heuristics));
  rules.push_back(std::make_unique<SwallowedExceptionRule>(heuristics));
  rules.push_back(std::make_unique<SqlInjectionRule>(heuristics));
  rules.push_back(std::make_unique<CursorLeakRule>(heuristics));
  rules.push_back(std::make_unique<CursorAccessRule>(heuristics));
  rules.push_back(std::make_unique<MediaPlayerStateRule>(heuristics));
  rules.push_back(std::make_unique<ReceiverRegistrationRule>(heuristics));
  rules.push_back(std::make_unique<MainThreadNetworkRule>(heuristics));
  rules.push_back(std::make_unique<FragmentContextRule>(heuristics));
  rules.push_back(std::make_unique<DialogShowRule>(heuristics));
  rules.push_back(std::make_unique<FragmentCommitRule>(heuristics));
  rules.push_back(std::make_unique<GlobalScopeRule>(heuristics));
  rules.push_back(std::make_unique<ResponseBodyRule>(heuristics));
  rules.push_back(std::make_unique<WebViewJavascriptRule>(heuristics));
  return rules;
}

} // namespace tracedroid
