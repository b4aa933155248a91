#pragma once

#include <cstdint>
#include <vector>

#include "ecs/Components.h"
#include "util/Math.h"

// Per-level difficulty scalars; a monotonic function of the level number.
struct LevelDifficulty {
  int levelIndex = 1;
  float gapDistance = 0.0F;
  float platformSpeed = 0.0F;
  int hazardCount = 0;
  int enemyCount = 0;
  int gemCount = 0;
  int platformCount = 0;
  int movingPlatformCount = 0;
  float timeLimit = 0.0F;  // seconds

  bool operator==(const LevelDifficulty&) const = default;
};

struct PlatformPlacement {
  Rect rect{};
  bool moving = false;
  float minX = 0.0F;  // path bounds (moving only)
  float maxX = 0.0F;
  float speed = 0.0F;

  bool operator==(const PlatformPlacement&) const = default;
};

struct HazardPlacement {
  Rect rect{};
  HazardKind kind = HazardKind::Spike;
  int damage = 1;
  float minX = 0.0F;  // patrol bounds (enemy only)
  float maxX = 0.0F;
  float speed = 0.0F;

  bool operator==(const HazardPlacement&) const = default;
};

struct GemPlacement {
  Rect rect{};
  int value = 10;

  bool operator==(const GemPlacement&) const = default;
};

struct LevelLayout {
  LevelDifficulty difficulty;
  std::uint64_t seed = 0;
  Rect bounds{};
  Vec2 spawn{};
  std::vector<PlatformPlacement> platforms;  // static ones first, in x order
  std::vector<HazardPlacement> hazards;
  std::vector<GemPlacement> gems;
  Rect checkpoint{};
  Rect exit{};

  bool operator==(const LevelLayout&) const = default;
};
