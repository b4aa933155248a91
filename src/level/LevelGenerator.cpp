#include "level/LevelGenerator.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

#include "util/Log.h"

namespace {

constexpr float kCheckpointW = 24.0F;
constexpr float kCheckpointH = 48.0F;
constexpr float kExitW = 32.0F;
constexpr float kExitH = 64.0F;
constexpr float kExitInset = 8.0F;

// Layouts must be identical on every standard library: raw mt19937 output only, no
// <random> distributions.
class LevelRng {
 public:
  LevelRng(std::uint64_t seed, int levelIndex) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xFFFFFFFFULL),
                      static_cast<std::uint32_t>(seed >> 32U),
                      static_cast<std::uint32_t>(levelIndex)};
    engine_.seed(seq);
  }

  // [0, 1) with 24 bits of precision.
  float unit() { return static_cast<float>(engine_() >> 8U) * (1.0F / 16777216.0F); }

  float range(float lo, float hi) { return lo + (hi - lo) * unit(); }

  int index(int count) {
    if (count <= 1)
      return 0;
    return static_cast<int>(engine_() % static_cast<std::uint32_t>(count));
  }

 private:
  std::mt19937 engine_;
};

}  // namespace

LevelGenerator::LevelGenerator(LevelTuning tuning, int gemValue)
    : tuning_(std::move(tuning)), gemValue_(gemValue) {}

bool LevelGenerator::isValidLevel(int levelIndex) const {
  return levelIndex >= 1 && levelIndex <= tuning_.levelCount;
}

bool LevelGenerator::difficulty(int levelIndex, LevelDifficulty& out) const {
  if (!isValidLevel(levelIndex)) {
    Log::errorf("level", "unknown level {} (valid range 1..{})", levelIndex, tuning_.levelCount);
    return false;
  }

  const float n = static_cast<float>(levelIndex);
  LevelDifficulty d{};
  d.levelIndex = levelIndex;
  d.gapDistance = tuning_.gapBase + tuning_.gapPerLevel * n;
  d.platformSpeed = tuning_.platformSpeedBase + tuning_.platformSpeedPerLevel * n;
  d.hazardCount = static_cast<int>(std::floor(tuning_.hazardBase + tuning_.hazardPerLevel * n));
  d.enemyCount = static_cast<int>(std::floor(tuning_.enemyPerLevel * n));
  d.gemCount = tuning_.gemBase + tuning_.gemPerLevel * levelIndex;
  d.platformCount = tuning_.platformBase + levelIndex;
  d.movingPlatformCount = (levelIndex + 1) / 2;
  d.timeLimit = tuning_.timeLimitBase + tuning_.timeLimitPerLevel * static_cast<float>(levelIndex - 1);
  out = d;
  return true;
}

bool LevelGenerator::generate(int levelIndex, std::uint64_t seed, LevelLayout& out) const {
  LevelDifficulty d{};
  if (!difficulty(levelIndex, d))
    return false;

  const LevelTuning& t = tuning_;
  LevelRng rng(seed, levelIndex);

  LevelLayout next{};
  next.difficulty = d;
  next.seed = seed;

  const float stride = d.gapDistance + t.platformWidth;
  for (int i = 0; i < d.platformCount; ++i) {
    // The first platform stays at the base height so the spawn is always safe.
    const float y = (i == 0) ? t.platformBaseY : t.platformBaseY - rng.unit() * t.platformBand;
    PlatformPlacement p{};
    p.rect = Rect{static_cast<float>(i) * stride, y, t.platformWidth, t.platformHeight};
    next.platforms.push_back(p);
  }
  const int staticCount = d.platformCount;
  const Rect first = next.platforms.front().rect;
  const Rect last = next.platforms.back().rect;
  const Rect middle = next.platforms[static_cast<std::size_t>(staticCount / 2)].rect;

  next.spawn = Vec2{first.x + t.spawnInsetX, first.top() - t.spawnClearance};
  next.bounds = Rect{0.0F, 0.0F, last.right(), t.worldHeight};

  // Moving platforms shuttle inside the gap between two static neighbours.
  for (int j = 0; j < d.movingPlatformCount; ++j) {
    const int gap = rng.index(staticCount - 1);
    const Rect lhs = next.platforms[static_cast<std::size_t>(gap)].rect;
    const Rect rhs = next.platforms[static_cast<std::size_t>(gap + 1)].rect;
    PlatformPlacement p{};
    p.moving = true;
    p.minX = lhs.right();
    p.maxX = std::max(p.minX, rhs.left() - t.platformWidth);
    p.speed = d.platformSpeed;
    const float x = rng.range(p.minX, p.maxX);
    const float y = t.platformBaseY - rng.unit() * t.platformBand;
    p.rect = Rect{x, y, t.platformWidth, t.platformHeight};
    next.platforms.push_back(p);
  }

  auto staticRect = [&next](int idx) { return next.platforms[static_cast<std::size_t>(idx)].rect; };

  for (int k = 0; k < d.gemCount; ++k) {
    const Rect host = staticRect(rng.index(staticCount));
    GemPlacement g{};
    g.value = gemValue_;
    const float x = host.x + rng.unit() * std::max(0.0F, host.w - t.gemSize);
    const float y = host.top() - t.gemHoverMin - rng.unit() * t.gemHoverRange - t.gemSize;
    g.rect = Rect{x, y, t.gemSize, t.gemSize};
    next.gems.push_back(g);
  }

  // Hazards never sit on the spawn or exit platforms.
  if (staticCount >= 3) {
    for (int k = 0; k < d.hazardCount; ++k) {
      const Rect host = staticRect(1 + rng.index(staticCount - 2));
      HazardPlacement h{};
      h.kind = HazardKind::Spike;
      h.damage = t.hazardDamage;
      const float x = host.x + rng.unit() * std::max(0.0F, host.w - t.spikeWidth);
      h.rect = Rect{x, host.top() - t.spikeHeight, t.spikeWidth, t.spikeHeight};
      next.hazards.push_back(h);
    }

    const float enemySpeed = t.enemySpeedBase + t.enemySpeedPerLevel * static_cast<float>(levelIndex);
    for (int k = 0; k < d.enemyCount; ++k) {
      const Rect host = staticRect(1 + rng.index(staticCount - 2));
      HazardPlacement h{};
      h.kind = HazardKind::Enemy;
      h.damage = t.hazardDamage;
      h.minX = host.x;
      h.maxX = std::max(host.x, host.right() - t.enemyWidth);
      h.speed = enemySpeed;
      h.rect = Rect{rng.range(h.minX, h.maxX), host.top() - t.enemyHeight, t.enemyWidth,
                    t.enemyHeight};
      next.hazards.push_back(h);
    }
  }

  next.checkpoint =
      Rect{middle.centerX() - kCheckpointW * 0.5F, middle.top() - kCheckpointH, kCheckpointW,
           kCheckpointH};
  next.exit = Rect{last.right() - kExitW - kExitInset, last.top() - kExitH, kExitW, kExitH};

  out = std::move(next);
  return true;
}
