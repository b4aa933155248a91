#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/GameConfig.h"
#include "core/Analytics.h"
#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "level/LevelGenerator.h"
#include "level/LevelLayout.h"

enum class GameState : std::uint8_t {
  Loading,
  Playing,
  Paused,
  LevelComplete,
  GameOver,
  Menu,
};

const char* gameStateName(GameState state);

struct SessionState {
  GameState state = GameState::Menu;
  int level = 1;
  std::int64_t score = 0;
  int gemsCollected = 0;
  int totalGems = 0;
  int lives = 3;
  float timeRemaining = 0.0F;
  float timeLimit = 0.0F;
  std::optional<Vec2> lastCheckpoint;

  int gemBank = 0;
  std::vector<int> unlockedLevels;  // beyond level 1, sorted
  bool gameComplete = false;

  // Level that needs a rewarded ad before it can be played (0 = none).
  int unlockPromptLevel = 0;
  int lastTimeBonus = 0;
};

// Owns the world for one run: level loading, score, lives, timer, checkpoint, persistence and
// analytics. Reacts to the world through GameplayEvents.
class Session {
 public:
  struct Options {
    std::string savePath;  // empty = don't persist
  };

  Session(GameConfig cfg, AnalyticsSink& analytics, Options opts);
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(Session&&) = delete;

  // Generates first; on failure nothing changes and false is returned.
  bool loadLevel(int levelIndex, bool resumeAtCheckpoint = false);

  void tick(TimeStep ts, const InputState& input);

  void pause();
  void resume();
  void togglePause();

  bool restartLevel();
  bool continueFromCheckpoint();
  bool nextLevel();
  bool startNewGame();
  bool loadSpecificLevel(int levelIndex);
  void goToMenu();
  // Menu only: forgets unlocks, gem bank and score, and deletes the save file.
  bool resetProgress();

  bool requestRewardedAd(int levelIndex);
  void finishRewardedAd(bool completed);
  [[nodiscard]] int pendingAdLevel() const { return pendingAdLevel_; }

  [[nodiscard]] bool isLevelUnlocked(int levelIndex) const;
  [[nodiscard]] bool isAdGated(int levelIndex) const;

  // World event handlers; public so the shell and tests can drive them directly.
  void onPlayerDeath(DeathCause cause);
  void onGemCollected(int value);
  void onCheckpointReached(Vec2 pos);
  void onExitReached();

  [[nodiscard]] const SessionState& state() const { return state_; }
  [[nodiscard]] const GameConfig& config() const { return cfg_; }
  [[nodiscard]] const LevelLayout& layout() const { return layout_; }
  [[nodiscard]] const LevelGenerator& generator() const { return generator_; }
  [[nodiscard]] bool levelReady() const { return levelReady_; }
  [[nodiscard]] int deathCount() const { return deathCount_; }
  [[nodiscard]] int levelCount() const { return generator_.levelCount(); }
  World& world() { return world_; }
  [[nodiscard]] const World& world() const { return world_; }

  void setSeed(std::uint64_t seed) { cfg_.session.seed = seed; }

 private:
  void completeLevel();
  void unlockLevel(int levelIndex, std::string_view method);
  void persist();
  void emit(std::string_view name, AnalyticsParams params = {});

  GameConfig cfg_;
  AnalyticsSink& analytics_;
  Options opts_;
  LevelGenerator generator_;

  World world_;
  LevelLayout layout_;
  SessionState state_;

  bool levelReady_ = false;
  bool levelCompleted_ = false;
  bool timeUpLatched_ = false;
  bool runStarted_ = false;
  std::int64_t scoreAtLevelStart_ = 0;
  int deathCount_ = 0;
  int pendingAdLevel_ = 0;
};
