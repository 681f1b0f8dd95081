/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/FragmentCommitRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class FragmentCommitRuleTest : public test::Test {};

TEST_F(FragmentCommitRuleTest, AsyncCallbacks) {
  auto rule = FragmentCommitRule(Heuristics());
  auto file = test::make_source_file(
      "HostActivity.kt",
      "class HostActivity : AppCompatActivity() {\n"
      "    fun open() {\n"
      "        repository.load().observe(this) { item ->\n"
      "            supportFragmentManager.beginTransaction()\n"
      "                .replace(R.id.container, DetailFragment.newInstance(item))\n"
      "                .commit()\n"
      "        }\n"
      "    }\n"
      "    fun save() {\n"
      "        lifecycleScope.launch {\n"
      "            prefs.edit().putString(\"k\", \"v\").commit()\n"
      "        }\n"
      "    }\n"
      "    fun guarded() {\n"
      "        viewModel.state.observe(this) {\n"
      "            if (supportFragmentManager.isStateSaved) return@observe\n"
      "            supportFragmentManager.beginTransaction().add(DetailFragment(), \"tag\").commitNow()\n"
      "        }\n"
      "    }\n"
      "    override fun onCreate(savedInstanceState: Bundle?) {\n"
      "        super.onCreate(savedInstanceState)\n"
      "        supportFragmentManager.beginTransaction().add(DetailFragment(), \"tag\").commit()\n"
      "    }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(6));
  EXPECT_THAT(
      test::severities(matches), testing::ElementsAre(Severity::Medium));
  EXPECT_EQ(
      matches[0].detail,
      "`commit()` runs in an asynchronous callback and throws if the activity state was already saved.");
}

} // namespace tracedroid
