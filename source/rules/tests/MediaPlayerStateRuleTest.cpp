/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/rules/MediaPlayerStateRule.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

class MediaPlayerStateRuleTest : public test::Test {};

TEST_F(MediaPlayerStateRuleTest, StateMachine) {
  auto rule = MediaPlayerStateRule(Heuristics());
  auto file = test::make_source_file(
      "Player.kt",
      "class Player {\n"
      "    private val mediaPlayer = MediaPlayer()\n"
      "\n"
      "    fun play() {\n"
      "        mediaPlayer.start()\n"
      "    }\n"
      "\n"
      "    fun playAsync(url: String) {\n"
      "        mediaPlayer.setDataSource(url)\n"
      "        mediaPlayer.prepareAsync()\n"
      "        mediaPlayer.start()\n"
      "    }\n"
      "\n"
      "    fun stop() {\n"
      "        mediaPlayer.release()\n"
      "        mediaPlayer.reset()\n"
      "    }\n"
      "\n"
      "    fun prepared(url: String) {\n"
      "        mediaPlayer.setDataSource(url)\n"
      "        mediaPlayer.prepare()\n"
      "        mediaPlayer.start()\n"
      "    }\n"
      "}\n");

  auto matches = rule.analyze(file);
  EXPECT_THAT(test::line_numbers(matches), testing::ElementsAre(5, 11, 16));
  EXPECT_THAT(
      test::severities(matches),
      testing::ElementsAre(Severity::Medium, Severity::High, Severity::High));
  EXPECT_EQ(
      matches[0].detail,
      "`mediaPlayer.start()` is called in `play`, which never prepares the player.");
  EXPECT_EQ(
      matches[2].detail,
      "`mediaPlayer.reset()` is called after `mediaPlayer.release()` at line 15.");
}

TEST_F(MediaPlayerStateRuleTest, PreparedListener) {
  auto rule = MediaPlayerStateRule(Heuristics());
  auto file = test::make_source_file(
      "Player.java",
      "public class Player {\n"
      "  private MediaPlayer audio;\n"
      "\n"
      "  void play(String url) {\n"
      "    audio.setDataSource(url);\n"
      "    audio.setOnPreparedListener(this);\n"
      "    audio.prepareAsync();\n"
      "    audio.start();\n"
      "  }\n"
      "\n"
      "  void restart() {\n"
      "    audio.release();\n"
      "    audio = new MediaPlayer();\n"
      "    audio.setDataSource(source);\n"
      "    audio.prepare();\n"
      "    audio.start();\n"
      "  }\n"
      "}\n");
  EXPECT_TRUE(rule.analyze(file).empty());
}

} // namespace tracedroid
