#pragma once

#include <cstdint>

#include "config/GameConfig.h"
#include "level/LevelLayout.h"

// Deterministic level builder: the same (level, seed, tuning) always yields the same layout.
class LevelGenerator {
 public:
  explicit LevelGenerator(LevelTuning tuning, int gemValue = 10);

  [[nodiscard]] int levelCount() const { return tuning_.levelCount; }
  [[nodiscard]] bool isValidLevel(int levelIndex) const;

  // False (and `out` untouched) for an unknown level index.
  bool difficulty(int levelIndex, LevelDifficulty& out) const;
  bool generate(int levelIndex, std::uint64_t seed, LevelLayout& out) const;

 private:
  LevelTuning tuning_;
  int gemValue_ = 10;
};
