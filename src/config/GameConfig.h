#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct PlayerTuning {
  float moveSpeed = 150.0F;       // px/s
  float jumpSpeed = 300.0F;       // px/s, initial upward speed
  float gravity = 980.0F;         // px/s^2
  float maxFallSpeed = 400.0F;    // px/s
  int maxHealth = 3;
  float invulnerabilitySeconds = 2.0F;
  float knockbackX = 100.0F;      // px/s
  bool canDoubleJump = true;
  float width = 32.0F;
  float height = 48.0F;
};

struct LevelTuning {
  int levelCount = 10;

  // difficulty(n) = base + perLevel * n
  float gapBase = 100.0F;
  float gapPerLevel = 20.0F;
  float platformSpeedBase = 50.0F;
  float platformSpeedPerLevel = 10.0F;
  float hazardBase = 2.0F;
  float hazardPerLevel = 0.5F;
  float enemyPerLevel = 0.5F;
  int gemBase = 10;
  int gemPerLevel = 2;
  int platformBase = 8;
  float timeLimitBase = 90.0F;
  float timeLimitPerLevel = 5.0F;

  float platformWidth = 120.0F;
  float platformHeight = 20.0F;
  float platformBaseY = 520.0F;   // lowest platform top
  float platformBand = 300.0F;    // platforms scatter upward within this band
  float worldHeight = 720.0F;
  float spawnInsetX = 16.0F;
  float spawnClearance = 64.0F;   // spawn point height above the first platform top
  float killPlaneMargin = 100.0F;

  float gemSize = 24.0F;
  float gemHoverMin = 40.0F;
  float gemHoverRange = 60.0F;
  float spikeWidth = 40.0F;
  float spikeHeight = 20.0F;
  float enemyWidth = 32.0F;
  float enemyHeight = 32.0F;
  float enemySpeedBase = 40.0F;
  float enemySpeedPerLevel = 5.0F;
  int hazardDamage = 1;
};

struct SessionTuning {
  int maxLives = 3;
  float rescueBonusSeconds = 10.0F;
  int completionGemBonus = 15;
  float timeBonusPerSecond = 10.0F;
  int gemValue = 10;
  std::uint64_t seed = 1;
  std::vector<int> adGatedLevels;
};

struct RenderTuning {
  std::string playerSprite;
  std::string gemSprite;
  std::string background = "#1a1530";
  float rewardedAdSeconds = 2.0F;  // simulated ad length in the shell
};

struct GameConfig {
  int version = 1;
  PlayerTuning player;
  LevelTuning level;
  SessionTuning session;
  RenderTuning render;

  bool loadFromToml(const char* path);
};

// Parses "#rrggbb"; returns false (and leaves `out` untouched) on malformed input.
bool parseHexColor(const std::string& text, std::uint32_t& out);
