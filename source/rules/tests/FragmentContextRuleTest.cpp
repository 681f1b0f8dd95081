/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/FragmentContextRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class FragmentContextRuleTest : public test::Test {};

TEST_F(FragmentContextRuleTest, AsyncCallbacks) {
  auto rule = FragmentContextRule(Heuristics());
  auto file = test::make_source_file(
      "ProfileFragment.kt",
      "class ProfileFragment : Fragment() {\n"
      "    fun load() {\n"
      "        api.fetch().enqueue(object : Callback<User> {\n"
      "            override fun onResponse(call: Call<User>, response: Response<User>) {\n"
      "                Toast.makeText(requireContext(), \"ok\", Toast.LENGTH_SHORT).show()\n"
      "            }\n"
      "            override fun onFailure(call: Call<User>, t: Throwable) {\n"
      "                if (!isAdded) return\n"
      "                Toast.makeText(requireContext(), \"failed\", Toast.LENGTH_SHORT).show()\n"
      "            }\n"
      "        })\n"
      "    }\n"
      "    override fun onViewCreated(view: View, savedInstanceState: Bundle?) {\n"
      "        val name = requireContext().getString(R.string.app_name)\n"
      "    }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(5));
  EXPECT_THAT(test::severities(matches), testing::ElementsAre(Severity::High));
  EXPECT_EQ(
      matches[0].detail,
      "`requireContext()` is called from an asynchronous callback, when the fragment may be detached.");
}

TEST_F(FragmentContextRuleTest, GetActivity) {
  auto rule = FragmentContextRule(Heuristics());
  auto file = test::make_source_file(
      "ListFragment.java",
      "public class ListFragment extends Fragment {\n"
      "  void refresh() {\n"
      "    handler.postDelayed(() -> {\n"
      "      getActivity().setTitle(title);\n"
      "    }, 500);\n"
      "  }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(4));
  EXPECT_EQ(
      matches[0].detail,
      "`getActivity()` is called from an asynchronous callback, when the fragment may be detached.");
}

} // namespace tracedroid
