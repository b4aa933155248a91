#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "TestSupport.h"
#include "config/GameConfig.h"
#include "util/Log.h"

namespace {

using testsupport::TempDir;

TEST(GameConfig, DefaultsMatchBaseTuning) {
  const GameConfig cfg{};
  EXPECT_FLOAT_EQ(cfg.player.moveSpeed, 150.0F);
  EXPECT_FLOAT_EQ(cfg.player.jumpSpeed, 300.0F);
  EXPECT_FLOAT_EQ(cfg.player.gravity, 980.0F);
  EXPECT_FLOAT_EQ(cfg.player.maxFallSpeed, 400.0F);
  EXPECT_EQ(cfg.player.maxHealth, 3);
  EXPECT_FLOAT_EQ(cfg.player.invulnerabilitySeconds, 2.0F);
  EXPECT_EQ(cfg.level.levelCount, 10);
  EXPECT_EQ(cfg.session.maxLives, 3);
  EXPECT_TRUE(cfg.session.adGatedLevels.empty());
}

TEST(GameConfig, LoadsEverySection) {
  TempDir dir;
  const std::string path = dir.write("game.toml", R"(
version = 2

[player]
move_speed = 240.0
jump_speed = 560.0
can_double_jump = false

[level]
level_count = 5
gap_base = 80.0

[session]
max_lives = 5
seed = 1234
ad_gated_levels = [4, 2]

[render]
background = "#000000"
gem_sprite = "data/gem.png"
)");

  GameConfig cfg{};
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(cfg.version, 2);
  EXPECT_FLOAT_EQ(cfg.player.moveSpeed, 240.0F);
  EXPECT_FLOAT_EQ(cfg.player.jumpSpeed, 560.0F);
  EXPECT_FALSE(cfg.player.canDoubleJump);
  EXPECT_FLOAT_EQ(cfg.player.gravity, 980.0F);
  EXPECT_EQ(cfg.level.levelCount, 5);
  EXPECT_FLOAT_EQ(cfg.level.gapBase, 80.0F);
  EXPECT_EQ(cfg.session.maxLives, 5);
  EXPECT_EQ(cfg.session.seed, 1234U);
  EXPECT_EQ(cfg.session.adGatedLevels, (std::vector<int>{2, 4}));
  EXPECT_EQ(cfg.render.background, "#000000");
  EXPECT_EQ(cfg.render.gemSprite, "data/gem.png");
}

TEST(GameConfig, UnknownKeysWarnButLoad) {
  TempDir dir;
  const std::string path = dir.write("game.toml", R"(
colour = "blue"

[player]
move_speed = 200.0
moon_gravity = 1.6
)");

  Log::resetCounters();
  GameConfig cfg{};
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(Log::counters().warnings, 2);
  EXPECT_FLOAT_EQ(cfg.player.moveSpeed, 200.0F);
}

TEST(GameConfig, OutOfRangeValuesAreClamped) {
  TempDir dir;
  const std::string path = dir.write("game.toml", R"(
[player]
gravity = -50.0
max_fall_speed = 0.0
max_health = 0
width = -4.0

[level]
level_count = 5
platform_base = 0

[session]
max_lives = -2
ad_gated_levels = [1, 3, 3, 50, 2]
)");

  GameConfig cfg{};
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  const PlayerTuning defaults{};
  EXPECT_FLOAT_EQ(cfg.player.gravity, 0.0F);
  EXPECT_FLOAT_EQ(cfg.player.maxFallSpeed, defaults.maxFallSpeed);
  EXPECT_EQ(cfg.player.maxHealth, 1);
  EXPECT_FLOAT_EQ(cfg.player.width, defaults.width);
  EXPECT_EQ(cfg.level.platformBase, 2);
  EXPECT_EQ(cfg.session.maxLives, 1);
  EXPECT_EQ(cfg.session.adGatedLevels, (std::vector<int>{2, 3}));
}

TEST(GameConfig, ParseErrorKeepsPreviousValues) {
  TempDir dir;
  const std::string path = dir.write("broken.toml", "[player\nmove_speed = 1.0\n");

  GameConfig cfg{};
  cfg.player.moveSpeed = 123.0F;
  EXPECT_FALSE(cfg.loadFromToml(path.c_str()));
  EXPECT_FLOAT_EQ(cfg.player.moveSpeed, 123.0F);

  EXPECT_FALSE(cfg.loadFromToml(dir.file("missing.toml").c_str()));
  EXPECT_FLOAT_EQ(cfg.player.moveSpeed, 123.0F);
}

TEST(GameConfig, HexColors) {
  std::uint32_t c = 7;
  EXPECT_TRUE(parseHexColor("#1a1530", c));
  EXPECT_EQ(c, 0x1a1530U);
  EXPECT_TRUE(parseHexColor("FFaa00", c));
  EXPECT_EQ(c, 0xffaa00U);

  c = 7;
  EXPECT_FALSE(parseHexColor("#12345", c));
  EXPECT_FALSE(parseHexColor("#12345g", c));
  EXPECT_EQ(c, 7U);
}

}  // namespace
